#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "Request.h"

using Response = boost::beast::http::response<boost::beast::http::string_body>;

// application/json response carrying body verbatim
Response json_response(boost::beast::http::status st, unsigned version, bool keep_alive, std::string body);
Response json_response(boost::beast::http::status st, const Request& req, std::string body);

// {"success":false,"message":...}
Response json_failure(boost::beast::http::status st, unsigned version, bool keep_alive, const std::string& message);
Response json_failure(boost::beast::http::status st, const Request& req, const std::string& message);
