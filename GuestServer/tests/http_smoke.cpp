#include <boost/asio.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include "guests/GuestRoutes.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "net/StaticFiles.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "MemoryGuestStore.h"
#include "http_test_util.h"

// Full server on an ephemeral port with an in-memory store, driven over
// real sockets.
static bool check(const ClientResponse& res, int code, const std::string& what) {
    if (res.result_int() != code) {
        std::cerr << what << ": expected " << code << " got " << res.result_int() << " body " << res.body() << "\n";
        return false;
    }
    return true;
}

static int run_checks(unsigned short port) {
    auto idx = request(port, "GET", "/");
    if (!check(idx, 200, "GET /")) return 1;
    if (idx.body().find("Guest List") == std::string::npos) { std::cerr << "index.html not served\n"; return 1; }
    if (idx[http::field::content_type].find("text/html") == beast::string_view::npos) { std::cerr << "index content type\n"; return 1; }

    auto css = request(port, "GET", "/app.css");
    if (!check(css, 200, "GET /app.css")) return 1;
    if (css[http::field::content_type].find("text/css") == beast::string_view::npos) { std::cerr << "css content type\n"; return 1; }
    if (!check(request(port, "GET", "/missing.js"), 404, "GET /missing.js")) return 1;
    if (!check(request(port, "GET", "/../etc/passwd"), 404, "traversal")) return 1;

    auto created = request(port, "POST", "/api/guests", "{\"name\":\"Alice\"}");
    if (!check(created, 201, "create Alice")) return 1;
    if (created.body().find("\"message\":\"Alice added successfully\"") == std::string::npos) { std::cerr << "create body: " << created.body() << "\n"; return 1; }
    if (created[http::field::access_control_allow_origin] != "http://example.test") { std::cerr << "CORS origin not echoed\n"; return 1; }
    if (created[http::field::content_type].find("application/json") == beast::string_view::npos) { std::cerr << "create content type\n"; return 1; }

    auto dup = request(port, "POST", "/api/guests", "{\"name\":\"Alice\"}");
    if (!check(dup, 400, "duplicate")) return 1;
    if (dup.body() != "{\"success\":false,\"message\":\"Guest already exists\"}") { std::cerr << "duplicate body: " << dup.body() << "\n"; return 1; }

    if (!check(request(port, "PUT", "/api/guests/1", "{\"status\":\"confirmed\"}"), 200, "confirm")) return 1;
    auto stats = request(port, "GET", "/api/stats");
    if (!check(stats, 200, "stats")) return 1;
    if (stats.body() != "{\"success\":true,\"total\":1,\"confirmed\":1,\"pending\":0,\"declined\":0}") { std::cerr << "stats body: " << stats.body() << "\n"; return 1; }
    if (!check(request(port, "GET", "/api/export"), 200, "export")) return 1;
    if (!check(request(port, "DELETE", "/api/guests/1"), 200, "delete")) return 1;
    if (!check(request(port, "DELETE", "/api/guests/1"), 404, "delete again")) return 1;
    auto list = request(port, "GET", "/api/guests");
    if (!check(list, 200, "list") || list.body() != "{\"success\":true,\"guests\":[]}") { std::cerr << "list body: " << list.body() << "\n"; return 1; }

    auto pre = request(port, "OPTIONS", "/api/guests/1");
    if (!check(pre, 204, "preflight")) return 1;
    if (pre[http::field::access_control_allow_methods].find("PUT") == beast::string_view::npos) { std::cerr << "preflight methods\n"; return 1; }

    auto nf = request(port, "GET", "/api/unknown");
    if (!check(nf, 404, "unknown api") || nf.body() != "{\"success\":false,\"message\":\"Not found\"}") { std::cerr << "404 body\n"; return 1; }
    if (!check(request(port, "PATCH", "/api/guests"), 405, "patch")) return 1;
    if (!check(request(port, "GET", "/health"), 200, "health")) return 1;

    std::string big_header = "GET /api/guests HTTP/1.1\r\nHost: x\r\nX-Pad: " + std::string(9000, 'a') + "\r\n\r\n";
    if (raw_request_status(port, big_header) != 431) { std::cerr << "oversized header not 431\n"; return 1; }
    std::string big_body = "POST /api/guests HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\nContent-Length: 2000000\r\n\r\n";
    if (raw_request_status(port, big_body) != 413) { std::cerr << "oversized body not 413\n"; return 1; }

    if (observability::Metrics::instance().requests_total("/api/guests/{id:int}", "DELETE", 404) != 1) { std::cerr << "metrics not recorded by route\n"; return 1; }
    return 0;
}

int main() {
    observability::set_log_level(4);
    observability::Metrics::instance().reset();

    char tmpl[] = "/tmp/guest_http_smoke_XXXXXX";
    if (!mkdtemp(tmpl)) { std::cerr << "mkdtemp failed\n"; return 1; }
    const std::string dir = tmpl;
    { std::ofstream(dir + "/index.html") << "<!doctype html><title>Guest List</title>"; }
    { std::ofstream(dir + "/app.css") << "body{margin:0}"; }

    boost::asio::io_context ioc;
    auto store = std::make_shared<MemoryGuestStore>();
    auto service = std::make_shared<guests::GuestService>(store);
    Router router;
    router.add_route("GET", "/health", [](const Request& req) {
        return json_response(boost::beast::http::status::ok, req, "{\"status\":\"ok\"}");
    });
    guests::register_guest_routes(router, service);
    statics::register_static_routes(router, dir);

    HttpServer server(ioc, 0, router, true, false);
    server.run();
    const unsigned short port = server.port();
    if (port == 0) { std::cerr << "server did not bind\n"; return 1; }
    std::thread t([&] { ioc.run(); });

    int rc = 1;
    try {
        rc = run_checks(port);
    } catch (const std::exception& e) {
        std::cerr << "http_smoke exception: " << e.what() << "\n";
        rc = 1;
    }

    boost::asio::post(ioc, [&] { server.stop(); });
    ioc.stop();
    t.join();
    std::remove((dir + "/index.html").c_str());
    std::remove((dir + "/app.css").c_str());
    rmdir(dir.c_str());

    if (rc == 0) std::cout << "http_smoke ok\n";
    return rc;
}
