#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {

// Rows of a finished statement, text format. NULL cells are nullopt.
struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// Fixed set of worker threads executing SQL off the application io_context.
// Every task opens its own connection, runs exactly one statement and closes
// the connection before the callback is posted back to app_ioc. Nothing is
// retried: a failed connect reports host_unreachable, a lost statement
// reports io_error, and server-side errors arrive as !DbResult::ok.
class DbPool {
public:
    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4);
    ~DbPool();

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    void async_exec(const std::string& sql, DbResultCb cb);
    void async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

DbResult to_db_result(PGresult* pr);

}
