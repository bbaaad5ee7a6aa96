#include "Config.h"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <stdexcept>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

// 1..65535, anything else keeps the current value
static void apply_port(Config& c, const std::string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used == s.size() && v > 0 && v <= 65535) c.port = static_cast<uint16_t>(v);
    } catch (const std::exception&) {}
}

int log_level_value(Config::LogLevel lvl) {
    switch (lvl) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    apply_port(c, getenv_or("PORT", "5000"));
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "dbname=guestlist");
    if (c.database_url.empty()) c.database_url = "dbname=guestlist";
    c.static_dir = getenv_or("STATIC_DIR", "static");
    if (c.static_dir.empty()) c.static_dir = "static";
    try { c.db_workers = std::stoi(getenv_or("DB_WORKERS", "4")); } catch (const std::exception&) {}
    c.db_workers = std::clamp(c.db_workers, 1, 64);

    // command line wins over the environment
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i + 1 < argc) apply_port(c, argv[++i]);
    }
    return c;
}

}
