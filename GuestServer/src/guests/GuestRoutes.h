#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/beast/http/status.hpp>
#include "GuestService.h"
#include "../net/Router.h"

namespace guests {

void register_guest_routes(Router& router, std::shared_ptr<GuestService> service);

boost::beast::http::status http_status_for(const Error& err);

std::string guest_json(const Guest& g);
std::string record_json(const GuestRecord& r);
std::string guest_list_json(const std::vector<Guest>& guests);
std::string stats_json(const GuestStats& s);
std::string export_json(const GuestExport& e);

}
