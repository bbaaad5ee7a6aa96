#include "Router.h"
#include <boost/beast/http.hpp>
#include <memory>

std::vector<std::string> Router::split(const std::string& path) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        out.emplace_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return out;
}

std::string Router::path_of(const Request& req) {
    std::string target(req.target());
    auto qpos = target.find('?');
    if (qpos != std::string::npos) target.erase(qpos);
    return target;
}

// "{name}" takes any non-empty segment, "{name:int}" only digits; name is
// rewritten to the bare placeholder name.
bool Router::capture_matches(std::string& name, const std::string& seg) {
    if (seg.empty()) return false;
    auto colon = name.find(':');
    if (colon == std::string::npos) return true;
    std::string type = name.substr(colon + 1);
    name.erase(colon);
    if (type == "int") {
        for (char c : seg) if (c < '0' || c > '9') return false;
    }
    return true;
}

void Router::add_route(std::string method, std::string path, SimpleHandler h) {
    add_async_route(std::move(method), std::move(path), [h = std::move(h)](const Request& req, const PathParams&, Reply reply) {
        reply(h(req));
    });
}

void Router::add_async_route(std::string method, std::string pattern, Handler h) {
    Route r;
    r.segments = split(pattern);
    for (const auto& s : r.segments) {
        if (s.size() >= 2 && s.front() == '{' && s.back() == '}') { r.literal = false; break; }
    }
    r.method = std::move(method);
    r.pattern = std::move(pattern);
    r.handler = std::move(h);
    routes_.push_back(std::move(r));
}

void Router::set_fallback(Handler h) { fallback_ = std::move(h); }

const Router::Route* Router::match(const std::string& method, const std::string& path, PathParams& params, bool& path_exists) const {
    path_exists = false;
    for (const auto& r : routes_) {
        if (r.literal && r.pattern == path) {
            path_exists = true;
            if (r.method == method) return &r;
        }
    }
    auto segs = split(path);
    for (const auto& r : routes_) {
        if (r.literal || r.segments.size() != segs.size()) continue;
        PathParams captured;
        bool ok = true;
        for (size_t i = 0; i < segs.size(); ++i) {
            const auto& ps = r.segments[i];
            if (ps.size() >= 2 && ps.front() == '{' && ps.back() == '}') {
                std::string name = ps.substr(1, ps.size() - 2);
                if (!capture_matches(name, segs[i])) { ok = false; break; }
                captured[std::move(name)] = segs[i];
            } else if (ps != segs[i]) { ok = false; break; }
        }
        if (!ok) continue;
        path_exists = true;
        if (r.method == method) { params = std::move(captured); return &r; }
    }
    return nullptr;
}

void Router::dispatch(const Request& req, Reply reply) const {
    std::string method(req.method_string());
    std::string path = path_of(req);
    PathParams params;
    bool path_exists = false;
    const Route* r = match(method, path, params, path_exists);
    if (r) {
        r->handler(req, params, std::move(reply));
        return;
    }
    if (path_exists) {
        reply(json_failure(boost::beast::http::status::method_not_allowed, req, "Method not allowed"));
        return;
    }
    if (fallback_ && req.method() == boost::beast::http::verb::get) {
        fallback_(req, params, std::move(reply));
        return;
    }
    reply(json_failure(boost::beast::http::status::not_found, req, "Not found"));
}

Response Router::route(const Request& req) const {
    auto out = std::make_shared<Response>(json_failure(boost::beast::http::status::internal_server_error, req, "Server error"));
    dispatch(req, [out](Response res) { *out = std::move(res); });
    return std::move(*out);
}

std::string Router::route_label(const Request& req) const {
    std::string path = path_of(req);
    PathParams params;
    bool path_exists = false;
    const Route* r = match(std::string(req.method_string()), path, params, path_exists);
    return r ? r->pattern : std::string("(unmatched)");
}
