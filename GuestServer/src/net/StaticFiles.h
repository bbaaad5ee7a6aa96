#pragma once

#include <optional>
#include <string>
#include "Router.h"

namespace statics {

// Content-Type for a file name by extension; application/octet-stream if unknown.
std::string mime_type(const std::string& name);

// Rejects empty names, "..", backslashes and absolute paths.
bool is_safe_relative(const std::string& rel);

std::optional<std::string> read_file(const std::string& dir, const std::string& rel);

// GET / -> <dir>/index.html, other unmatched GETs -> <dir>/<path>.
void register_static_routes(Router& router, const std::string& dir);

}
