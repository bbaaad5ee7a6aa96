#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

using PathParams = std::unordered_map<std::string, std::string>;

// Method + path dispatch. Patterns are literal paths whose segments may be
// "{name}" or "{name:int}" placeholders; literal routes win over placeholder
// routes. The
// query string is ignored. Unknown paths answer 404, known paths with the
// wrong method answer 405, both as {"success":false,"message":...}.
class Router {
public:
    using Reply = std::function<void(Response)>;
    using Handler = std::function<void(const Request&, const PathParams&, Reply)>;
    using SimpleHandler = std::function<Response(const Request&)>;

    void add_route(std::string method, std::string path, SimpleHandler h);
    void add_async_route(std::string method, std::string pattern, Handler h);

    // Consulted for GET requests no route matches (static assets).
    void set_fallback(Handler h);

    void dispatch(const Request& req, Reply reply) const;
    // For handlers that reply before returning; a reply that never arrives
    // reads as 500.
    Response route(const Request& req) const;

    // Pattern of the route serving req, "(unmatched)" when none does.
    std::string route_label(const Request& req) const;

    static std::string path_of(const Request& req);

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        bool literal = true;
        Handler handler;
    };
    const Route* match(const std::string& method, const std::string& path, PathParams& params, bool& path_exists) const;
    static std::vector<std::string> split(const std::string& path);
    static bool capture_matches(std::string& name, const std::string& seg);
    std::vector<Route> routes_;
    Handler fallback_;
};
