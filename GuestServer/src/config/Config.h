#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 5000;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url = "dbname=guestlist";
    int db_workers = 4;
    std::string static_dir = "static";
    static Config from_env(int argc, char** argv);
};

int log_level_value(Config::LogLevel lvl);

}
