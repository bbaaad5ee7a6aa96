#include "Guest.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace guests {

std::optional<Status> parse_status(std::string_view s) {
    if (s == "pending") return Status::pending;
    if (s == "confirmed") return Status::confirmed;
    if (s == "declined") return Status::declined;
    return std::nullopt;
}

const char* to_string(Status s) {
    switch (s) {
        case Status::pending: return "pending";
        case Status::confirmed: return "confirmed";
        case Status::declined: return "declined";
    }
    return "pending";
}

// White_Space code points, the set str.strip() removes.
static bool is_unicode_space(uint32_t cp) {
    if (cp >= 0x09 && cp <= 0x0D) return true;
    if (cp >= 0x1C && cp <= 0x20) return true;
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Decodes the code point starting at s[i] into cp and returns its byte
// length; malformed sequences decode as a single non-space byte.
static std::size_t decode_at(std::string_view s, std::size_t i, uint32_t& cp) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || i + len > s.size()) { cp = 0xFFFD; return 1; }
    cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
    for (std::size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) { cp = 0xFFFD; return 1; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    uint32_t cp = 0;
    while (b < e) {
        std::size_t len = decode_at(s, b, cp);
        if (!is_unicode_space(cp)) break;
        b += len;
    }
    while (e > b) {
        // back up to the lead byte of the last code point
        size_t start = e - 1;
        while (start > b && e - start < 4 && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) --start;
        std::size_t len = decode_at(s, start, cp);
        if (start + len != e || !is_unicode_space(cp)) break;
        e = start;
    }
    return std::string(s.substr(b, e - b));
}

std::size_t utf8_length(std::string_view s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string local_iso_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(us));
    return std::string(buf);
}

}
