#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace guests {

enum class errc {
    validation = 1,
    conflict,
    not_found,
    internal
};

const boost::system::error_category& guest_category() noexcept;

inline boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), guest_category());
}

// Outcome passed to every store/service completion. An empty code means
// success; message is what the caller shows to the client.
struct Error {
    boost::system::error_code code;
    std::string message;

    explicit operator bool() const noexcept { return static_cast<bool>(code); }
    bool is(errc e) const noexcept { return code == make_error_code(e); }
};

inline Error make_error(errc e, std::string message) {
    return Error{make_error_code(e), std::move(message)};
}

}

namespace boost { namespace system {
template <> struct is_error_code_enum<guests::errc> : std::true_type {};
} }
