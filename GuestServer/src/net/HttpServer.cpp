#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static constexpr std::size_t kHeaderLimit = 8 * 1024;
static constexpr std::size_t kBodyLimit = 1 * 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    const Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5; 
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;

    Session(net::ip::tcp::socket&& s, const Router& r, bool me, bool al)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        // idle/slow header guard
        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "Header too large", true);
                    return;
                }
                // Content-Length over the body limit is rejected while parsing the header
                if (ec == http::error::body_limit) {
                    self->reply_json_error(http::status::payload_too_large, "Body too large", true);
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "Bad request", true);
                    return;
                }
                self->close_socket();
                return;
            }

            self->http_version = parser->get().version();

            std::size_t content_len = 0;
            if (auto cl = parser->content_length()) content_len = static_cast<std::size_t>(*cl);
            if (content_len > kBodyLimit) {
                observability::log_info("oversized_body_header", {{"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "Body too large", true);
                return;
            }

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "Body too large", true);
                        return;
                    }
                    self->close_socket();
                    return;
                }

                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        auto self = shared_from_this();

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res);
            return;
        }

        // the reply may arrive later from a storage worker completion
        auto replied = std::make_shared<bool>(false);
        try {
            router.dispatch(req, [self, replied](Response res) {
                if (*replied) return;
                *replied = true;
                self->send_response(std::make_shared<Response>(std::move(res)));
            });
        } catch (const std::exception& e) {
            observability::log_error("handler_exception", {{"path", Router::path_of(req)}, {"err", std::string(e.what())}});
            if (*replied) return;
            *replied = true;
            send_response(std::make_shared<Response>(json_failure(http::status::internal_server_error, req, "Server error")));
        }
    }

    void send_response(std::shared_ptr<Response> sp) {
        auto self = shared_from_this();

        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(req.keep_alive());
        }
        auto it = req.find(http::field::origin);
        if (it != req.end()) sp->set(http::field::access_control_allow_origin, std::string(it->value()));
        else sp->set(http::field::access_control_allow_origin, "*");

        record(sp->result_int());

        http::async_write(socket, *sp, [self, sp](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) {
                self->do_read();
            } else {
                self->graceful_close_after_write();
            }
        });
    }

    void record(int code) {
        if (!metrics_enabled && !access_log) return;
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string method(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().record(router.route_label(req), method, code, ms);
        }
        if (access_log) {
            observability::log_info("request", {{"method", method}, {"path", Router::path_of(req)}, {"status", int64_t(code)}, {"ms", ms}});
        }
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    // Half-close, then read until the peer closes or the drain timer fires so
    // the client sees the response instead of a reset.
    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.cancel();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return; 
            self->close_socket(false);
        });
    }

    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                self->read_timer.cancel();
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    // Protocol-level failures before a request reached the router.
    void reply_json_error(http::status st, const std::string& message, bool close_conn) {
        auto res = std::make_shared<Response>(json_failure(st, http_version, !close_conn, message));
        res->set(http::field::access_control_allow_origin, "*");
        if (!close_conn) {
            send_response(res);
            return;
        }
        res->set(http::field::connection, "close");
        http::async_write(socket, *res, [self = shared_from_this(), res](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

unsigned short HttpServer::port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_)->run();
        } else observability::log_warn("accept_error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
