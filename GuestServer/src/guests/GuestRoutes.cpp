#include "GuestRoutes.h"
#include <sstream>
#include <stdexcept>
#include "../net/MiniJson.h"

namespace http = boost::beast::http;

namespace guests {

http::status http_status_for(const Error& err) {
    if (!err) return http::status::ok;
    if (err.is(errc::validation) || err.is(errc::conflict)) return http::status::bad_request;
    if (err.is(errc::not_found)) return http::status::not_found;
    return http::status::internal_server_error;
}

std::string guest_json(const Guest& g) {
    std::ostringstream ss;
    ss << "{\"id\":" << g.id
       << ",\"name\":\"" << json_escape_resp(g.name) << '"'
       << ",\"status\":\"" << to_string(g.status) << "\"}";
    return ss.str();
}

std::string record_json(const GuestRecord& r) {
    std::ostringstream ss;
    ss << "{\"id\":" << r.id
       << ",\"name\":\"" << json_escape_resp(r.name) << '"'
       << ",\"status\":\"" << to_string(r.status) << '"'
       << ",\"added_date\":\"" << json_escape_resp(r.added_date) << "\"}";
    return ss.str();
}

std::string guest_list_json(const std::vector<Guest>& guests) {
    std::string out = "{\"success\":true,\"guests\":[";
    for (size_t i = 0; i < guests.size(); ++i) {
        if (i) out += ',';
        out += guest_json(guests[i]);
    }
    out += "]}";
    return out;
}

std::string stats_json(const GuestStats& s) {
    std::ostringstream ss;
    ss << "{\"success\":true"
       << ",\"total\":" << s.total
       << ",\"confirmed\":" << s.confirmed
       << ",\"pending\":" << s.pending
       << ",\"declined\":" << s.declined << '}';
    return ss.str();
}

std::string export_json(const GuestExport& e) {
    std::string out = "{\"success\":true,\"export_date\":\"" + json_escape_resp(e.export_date) + "\",\"guests\":[";
    for (size_t i = 0; i < e.guests.size(); ++i) {
        if (i) out += ',';
        out += record_json(e.guests[i]);
    }
    out += "]}";
    return out;
}

static std::string success_message_json(const std::string& message) {
    return std::string("{\"success\":true,\"message\":\"") + json_escape_resp(message) + "\"}";
}

// the router only admits digits; ones past int64 are not a route either
static bool parse_path_id(const PathParams& params, int64_t& id) {
    auto it = params.find("id");
    if (it == params.end()) return false;
    auto v = parse_id_sv(it->second);
    if (!v) return false;
    id = *v;
    return true;
}

// Reads a string field from a JSON object body. Returns false (after
// replying 400) when the body is not a JSON object or the field is malformed.
static bool read_string_field(const Request& req, const std::string& key, std::string& out, const Router::Reply& reply) {
    const std::string& body = req.body();
    if (!json_is_object(body)) {
        reply(json_failure(http::status::bad_request, req, "Invalid request body"));
        return false;
    }
    try {
        out = json_extract_string(body, key);
    } catch (const std::runtime_error&) {
        reply(json_failure(http::status::bad_request, req, "Invalid request body"));
        return false;
    }
    return true;
}

namespace {

// Completion side of a request: the handler's Request may be gone by the
// time the store answers, so only what the response needs is kept.
struct ReplyTo {
    Router::Reply reply;
    unsigned version = 11;
    bool keep_alive = true;

    ReplyTo(const Request& req, Router::Reply r)
        : reply(std::move(r)), version(req.version()), keep_alive(req.keep_alive()) {}

    void ok(http::status st, std::string body) const {
        reply(json_response(st, version, keep_alive, std::move(body)));
    }
    void fail(const Error& err) const {
        reply(json_failure(http_status_for(err), version, keep_alive, err.message));
    }
};

}

void register_guest_routes(Router& router, std::shared_ptr<GuestService> service) {
    router.add_async_route("POST", "/api/guests", [service](const Request& req, const PathParams&, Router::Reply reply) {
        std::string name;
        if (!read_string_field(req, "name", name, reply)) return;
        ReplyTo to(req, std::move(reply));
        service->create(name, [to](const Error& err, Guest g) {
            if (err) { to.fail(err); return; }
            std::string body = std::string("{\"success\":true,\"message\":\"") + json_escape_resp(g.name + " added successfully")
                + "\",\"guest\":" + guest_json(g) + "}";
            to.ok(http::status::created, std::move(body));
        });
    });

    router.add_async_route("GET", "/api/guests", [service](const Request& req, const PathParams&, Router::Reply reply) {
        ReplyTo to(req, std::move(reply));
        service->list([to](const Error& err, std::vector<Guest> guests) {
            if (err) { to.fail(err); return; }
            to.ok(http::status::ok, guest_list_json(guests));
        });
    });

    router.add_async_route("PUT", "/api/guests/{id:int}", [service](const Request& req, const PathParams& params, Router::Reply reply) {
        int64_t id = 0;
        if (!parse_path_id(params, id)) { reply(json_failure(http::status::not_found, req, "Not found")); return; }
        std::string status;
        if (!read_string_field(req, "status", status, reply)) return;
        ReplyTo to(req, std::move(reply));
        service->update_status(id, status, [to](const Error& err) {
            if (err) { to.fail(err); return; }
            to.ok(http::status::ok, success_message_json("Status updated"));
        });
    });

    router.add_async_route("DELETE", "/api/guests/{id:int}", [service](const Request& req, const PathParams& params, Router::Reply reply) {
        int64_t id = 0;
        if (!parse_path_id(params, id)) { reply(json_failure(http::status::not_found, req, "Not found")); return; }
        ReplyTo to(req, std::move(reply));
        service->remove(id, [to](const Error& err) {
            if (err) { to.fail(err); return; }
            to.ok(http::status::ok, success_message_json("Guest removed"));
        });
    });

    router.add_async_route("GET", "/api/stats", [service](const Request& req, const PathParams&, Router::Reply reply) {
        ReplyTo to(req, std::move(reply));
        service->stats([to](const Error& err, GuestStats s) {
            if (err) { to.fail(err); return; }
            to.ok(http::status::ok, stats_json(s));
        });
    });

    router.add_async_route("GET", "/api/export", [service](const Request& req, const PathParams&, Router::Reply reply) {
        ReplyTo to(req, std::move(reply));
        service->export_all([to](const Error& err, GuestExport e) {
            if (err) { to.fail(err); return; }
            to.ok(http::status::ok, export_json(e));
        });
    });
}

}
