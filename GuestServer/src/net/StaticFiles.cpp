#include "StaticFiles.h"
#include <fstream>
#include <iterator>
#include <sstream>

namespace http = boost::beast::http;

namespace statics {

std::string mime_type(const std::string& name) {
    auto dot = name.rfind('.');
    std::string ext = dot == std::string::npos ? std::string() : name.substr(dot + 1);
    if (ext == "html" || ext == "htm") return "text/html; charset=utf-8";
    if (ext == "js") return "application/javascript; charset=utf-8";
    if (ext == "css") return "text/css; charset=utf-8";
    if (ext == "json") return "application/json; charset=utf-8";
    if (ext == "txt") return "text/plain; charset=utf-8";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "ico") return "image/x-icon";
    return "application/octet-stream";
}

bool is_safe_relative(const std::string& rel) {
    if (rel.empty() || rel.front() == '/') return false;
    if (rel.find('\\') != std::string::npos || rel.find('\0') != std::string::npos) return false;
    std::istringstream parts(rel);
    std::string seg;
    while (std::getline(parts, seg, '/')) {
        if (seg.empty() || seg == "." || seg == "..") return false;
    }
    return true;
}

std::optional<std::string> read_file(const std::string& dir, const std::string& rel) {
    if (!is_safe_relative(rel)) return std::nullopt;
    std::ifstream in(dir + "/" + rel, std::ios::binary);
    if (!in) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return data;
}

static Response file_response(const Request& req, const std::string& dir, const std::string& rel) {
    auto data = read_file(dir, rel);
    if (!data) return json_failure(http::status::not_found, req, "Not found");
    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, mime_type(rel));
    res.keep_alive(req.keep_alive());
    res.body() = std::move(*data);
    res.prepare_payload();
    return res;
}

void register_static_routes(Router& router, const std::string& dir) {
    router.add_route("GET", "/", [dir](const Request& req) {
        return file_response(req, dir, "index.html");
    });
    router.set_fallback([dir](const Request& req, const PathParams&, Router::Reply reply) {
        std::string path = Router::path_of(req);
        reply(file_response(req, dir, path.size() > 1 ? path.substr(1) : std::string("index.html")));
    });
}

}
