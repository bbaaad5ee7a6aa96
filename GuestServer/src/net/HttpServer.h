#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"

// Accepts connections and runs one Session per connection on ioc. Every
// request goes through the router; handler exceptions become 500s.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log);
    void run();
    void stop();
    // Bound port; differs from the requested one when that was 0.
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
};
