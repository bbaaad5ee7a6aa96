#include "DbPool.h"
#include <cstdlib>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include "../observability/Logging.h"

namespace db {

namespace {

struct ConnCloser { void operator()(PGconn* c) const noexcept { if (c) PQfinish(c); } };
struct ResultClearer { void operator()(PGresult* r) const noexcept { if (r) PQclear(r); } };

using ConnPtr = std::unique_ptr<PGconn, ConnCloser>;
using PgResultPtr = std::unique_ptr<PGresult, ResultClearer>;

std::string trim_pg_message(const char* m) {
    std::string s = m ? m : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
    return s;
}

}

DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    r.message = trim_pg_message(PQresultErrorMessage(pr));
    int nfields = PQnfields(pr);
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = (ct && *ct) ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    return r;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 4;

    struct Task { std::function<void()> fn; };
    std::queue<Task> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_)
        : app_ioc(ioc), conninfo(ci), workers(workers_ < 1 ? 1 : workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn();
            } catch (const std::exception& e) {
                observability::log_error("db_task_exception", {{"err", std::string(e.what())}});
            }
        }
    }

    void post_task(std::function<void()> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }

    // Runs on a worker thread. The connection lives only for this call.
    void run_statement(const std::string& sql, const std::vector<std::string>* params, const DbResultCb& cb) {
        boost::system::error_code ec;
        DbResult result;
        {
            ConnPtr conn(PQconnectdb(conninfo.c_str()));
            if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
                ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
                result.message = conn ? trim_pg_message(PQerrorMessage(conn.get())) : std::string("out of memory");
                observability::log_error("db_connect_failed", {{"err", result.message}});
            } else {
                PgResultPtr pr;
                if (params) {
                    std::vector<const char*> cparams; cparams.reserve(params->size());
                    for (const auto& p : *params) cparams.push_back(p.c_str());
                    pr.reset(PQexecParams(conn.get(), sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0));
                } else {
                    pr.reset(PQexec(conn.get(), sql.c_str()));
                }
                if (!pr) {
                    ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                    result.message = trim_pg_message(PQerrorMessage(conn.get()));
                    observability::log_error("db_exec_failed", {{"err", result.message}});
                } else {
                    result = to_db_result(pr.get());
                    if (!result.ok) {
                        observability::log_warn("db_exec_failed", {{"sqlstate", result.sqlstate}, {"err", result.message}});
                    }
                }
            }
        }
        boost::asio::post(app_ioc, [cb, ec, result = std::move(result)]() mutable {
            cb(ec, std::move(result));
        });
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers)
    : impl_(std::make_unique<Impl>(app_ioc, conninfo, workers)) {}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, cb = std::move(cb)]() {
        impl->run_statement(sql, nullptr, cb);
    });
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, params = std::move(params), cb = std::move(cb)]() {
        impl->run_statement(sql, &params, cb);
    });
}

}
