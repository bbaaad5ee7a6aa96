#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/StaticFiles.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "guests/PgGuestStore.h"
#include "guests/GuestService.h"
#include "guests/GuestRoutes.h"

using config::Config;
using observability::log_info;
using observability::log_error;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(config::log_level_value(cfg.log_level));

    try {
        boost::asio::io_context io;

        Router router;
        router.add_route("GET", "/health", [](const Request& req) {
            return json_response(boost::beast::http::status::ok, req, "{\"status\":\"ok\"}");
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        auto dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
        auto store = std::make_shared<guests::PgGuestStore>(dbpool);
        auto service = std::make_shared<guests::GuestService>(store);
        guests::register_guest_routes(router, service);
        statics::register_static_routes(router, cfg.static_dir);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        std::unique_ptr<HttpServer> server;
        int exit_code = 0;

        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("server_stop", {{"signal", int64_t(sig)}});
            if (server) server->stop();
            io.stop();
        });

        // the listener opens only once the table exists
        store->async_ensure_schema([&](const guests::Error& err) {
            if (err) {
                log_error("schema_failed", {{"err", err.message}});
                exit_code = 1;
                io.stop();
                return;
            }
            log_info("schema_ready");
            server = std::make_unique<HttpServer>(io, cfg.port, router, cfg.metrics_enabled, cfg.access_log);
            server->run();
            log_info("server_start", {{"port", int64_t(server->port())}, {"static_dir", cfg.static_dir}});
        });

        for (;;) {
            try {
                io.run();
                break;
            } catch (const boost::system::system_error& e) {
                // bind failures and the like are fatal
                std::cerr << "server error: " << e.what() << std::endl;
                return 1;
            } catch (const std::exception& e) {
                log_error("io_exception", {{"err", std::string(e.what())}});
            }
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }
}
