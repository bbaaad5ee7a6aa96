#include "PgGuestStore.h"
#include "../net/MiniJson.h"

namespace guests {

namespace {

const char* kUniqueViolation = "23505";

std::optional<int64_t> cell_int(const std::optional<std::string>& o) {
    return json_parse_int_strict(o);
}

}

const char* PgGuestStore::schema_sql() {
    return "CREATE TABLE IF NOT EXISTS guests ("
           "id BIGSERIAL PRIMARY KEY, "
           "name TEXT NOT NULL UNIQUE, "
           "status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','confirmed','declined')), "
           "added_date TEXT NOT NULL)";
}

Error classify_failure(const boost::system::error_code& ec, const db::DbResult& r) {
    if (ec) {
        std::string msg = r.message.empty() ? ec.message() : r.message;
        return make_error(errc::internal, msg);
    }
    if (r.ok) return Error{};
    if (r.sqlstate == kUniqueViolation) return make_error(errc::conflict, "Guest already exists");
    return make_error(errc::internal, r.message.empty() ? std::string("database error") : r.message);
}

std::optional<Guest> guest_from_row(const std::vector<std::optional<std::string>>& row) {
    if (row.size() < 3 || !row[1].has_value() || !row[2].has_value()) return std::nullopt;
    auto id = cell_int(row[0]);
    auto st = parse_status(*row[2]);
    if (!id || !st) return std::nullopt;
    return Guest{*id, *row[1], *st};
}

std::optional<GuestRecord> record_from_row(const std::vector<std::optional<std::string>>& row) {
    if (row.size() < 4 || !row[3].has_value()) return std::nullopt;
    auto g = guest_from_row(row);
    if (!g) return std::nullopt;
    return GuestRecord{g->id, std::move(g->name), g->status, *row[3]};
}

PgGuestStore::PgGuestStore(std::shared_ptr<db::DbPool> db) : db_(std::move(db)) {}

void PgGuestStore::async_ensure_schema(DoneCb cb) {
    db_->async_exec(schema_sql(), [cb](const boost::system::error_code& ec, db::DbResult r) {
        cb(classify_failure(ec, r));
    });
}

void PgGuestStore::async_insert(const std::string& name, const std::string& added_date, GuestCb cb) {
    const std::string sql = "INSERT INTO guests (name, status, added_date) VALUES ($1, 'pending', $2) RETURNING id, name, status";
    db_->async_exec_params(sql, std::vector<std::string>{name, added_date}, [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err, Guest{}); return; }
        std::optional<Guest> g;
        if (!r.rows.empty()) g = guest_from_row(r.rows[0]);
        if (!g) { cb(make_error(errc::internal, "insert returned no row"), Guest{}); return; }
        cb(Error{}, std::move(*g));
    });
}

void PgGuestStore::async_list(GuestListCb cb) {
    db_->async_exec("SELECT id, name, status FROM guests ORDER BY id ASC", [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err, {}); return; }
        std::vector<Guest> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) {
            auto g = guest_from_row(row);
            if (!g) { cb(make_error(errc::internal, "malformed guest row"), {}); return; }
            out.push_back(std::move(*g));
        }
        cb(Error{}, std::move(out));
    });
}

void PgGuestStore::async_update_status(int64_t id, Status status, DoneCb cb) {
    const std::string sql = "UPDATE guests SET status = $1 WHERE id = $2";
    db_->async_exec_params(sql, std::vector<std::string>{to_string(status), std::to_string(id)}, [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err); return; }
        if (r.affected_rows == 0) { cb(make_error(errc::not_found, "Guest not found")); return; }
        cb(Error{});
    });
}

void PgGuestStore::async_remove(int64_t id, DoneCb cb) {
    db_->async_exec_params("DELETE FROM guests WHERE id = $1", std::vector<std::string>{std::to_string(id)}, [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err); return; }
        if (r.affected_rows == 0) { cb(make_error(errc::not_found, "Guest not found")); return; }
        cb(Error{});
    });
}

void PgGuestStore::async_stats(StatsCb cb) {
    // one statement, so the four counts come from the same snapshot
    const std::string sql =
        "SELECT COUNT(*), "
        "COUNT(*) FILTER (WHERE status = 'confirmed'), "
        "COUNT(*) FILTER (WHERE status = 'pending'), "
        "COUNT(*) FILTER (WHERE status = 'declined') "
        "FROM guests";
    db_->async_exec(sql, [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err, GuestStats{}); return; }
        if (r.rows.empty() || r.rows[0].size() < 4) { cb(make_error(errc::internal, "stats returned no row"), GuestStats{}); return; }
        const auto& row = r.rows[0];
        auto total = cell_int(row[0]), confirmed = cell_int(row[1]), pending = cell_int(row[2]), declined = cell_int(row[3]);
        if (!total || !confirmed || !pending || !declined) { cb(make_error(errc::internal, "malformed stats row"), GuestStats{}); return; }
        cb(Error{}, GuestStats{*total, *confirmed, *pending, *declined});
    });
}

void PgGuestStore::async_list_records(RecordListCb cb) {
    db_->async_exec("SELECT id, name, status, added_date FROM guests ORDER BY id ASC", [cb](const boost::system::error_code& ec, db::DbResult r) {
        auto err = classify_failure(ec, r);
        if (err) { cb(err, {}); return; }
        std::vector<GuestRecord> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) {
            auto rec = record_from_row(row);
            if (!rec) { cb(make_error(errc::internal, "malformed guest row"), {}); return; }
            out.push_back(std::move(*rec));
        }
        cb(Error{}, std::move(out));
    });
}

}
