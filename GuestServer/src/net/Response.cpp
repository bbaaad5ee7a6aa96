#include "Response.h"
#include "MiniJson.h"

Response json_response(boost::beast::http::status st, unsigned version, bool keep_alive, std::string body) {
    Response res{st, version};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response json_response(boost::beast::http::status st, const Request& req, std::string body) {
    return json_response(st, req.version(), req.keep_alive(), std::move(body));
}

Response json_failure(boost::beast::http::status st, unsigned version, bool keep_alive, const std::string& message) {
    return json_response(st, version, keep_alive, std::string("{\"success\":false,\"message\":\"") + json_escape_resp(message) + "\"}");
}

Response json_failure(boost::beast::http::status st, const Request& req, const std::string& message) {
    return json_failure(st, req.version(), req.keep_alive(), message);
}
