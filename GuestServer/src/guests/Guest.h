#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guests {

enum class Status { pending, confirmed, declined };

constexpr std::size_t kMaxNameChars = 50;

std::optional<Status> parse_status(std::string_view s);
const char* to_string(Status s);

// List projection: added_date is deliberately absent.
struct Guest {
    int64_t id = 0;
    std::string name;
    Status status = Status::pending;
};

struct GuestRecord {
    int64_t id = 0;
    std::string name;
    Status status = Status::pending;
    std::string added_date;
};

struct GuestStats {
    int64_t total = 0;
    int64_t confirmed = 0;
    int64_t pending = 0;
    int64_t declined = 0;
};

struct GuestExport {
    std::string export_date;
    std::vector<GuestRecord> guests;
};

// Strips leading/trailing Unicode whitespace (ASCII, NBSP, U+2000..U+200A,
// U+2028/2029, U+3000 and the rest of the White_Space set).
std::string trim(std::string_view s);

// Number of code points in a UTF-8 string (continuation bytes are not counted).
std::size_t utf8_length(std::string_view s);

// Local wall clock as YYYY-MM-DDTHH:MM:SS.ffffff
std::string local_iso_timestamp();

}
