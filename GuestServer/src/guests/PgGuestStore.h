#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "GuestStore.h"
#include "../db/DbPool.h"

namespace guests {

class PgGuestStore : public GuestStore {
public:
    explicit PgGuestStore(std::shared_ptr<db::DbPool> db);

    void async_ensure_schema(DoneCb cb) override;
    void async_insert(const std::string& name, const std::string& added_date, GuestCb cb) override;
    void async_list(GuestListCb cb) override;
    void async_update_status(int64_t id, Status status, DoneCb cb) override;
    void async_remove(int64_t id, DoneCb cb) override;
    void async_stats(StatsCb cb) override;
    void async_list_records(RecordListCb cb) override;

    static const char* schema_sql();

private:
    std::shared_ptr<db::DbPool> db_;
};

// Maps a finished statement onto the guests error taxonomy. Returns an empty
// Error when the statement succeeded.
Error classify_failure(const boost::system::error_code& ec, const db::DbResult& r);

// Decoders for rows shaped (id, name, status) and (id, name, status, added_date).
std::optional<Guest> guest_from_row(const std::vector<std::optional<std::string>>& row);
std::optional<GuestRecord> record_from_row(const std::vector<std::optional<std::string>>& row);

}
