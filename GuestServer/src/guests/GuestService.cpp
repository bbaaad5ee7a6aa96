#include "GuestService.h"
#include "../observability/Logging.h"

namespace guests {

GuestService::GuestService(std::shared_ptr<GuestStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

Error GuestService::validate_name(const std::string& raw_name, std::string& out) {
    out = trim(raw_name);
    if (out.empty()) return make_error(errc::validation, "Name required");
    if (utf8_length(out) > kMaxNameChars) return make_error(errc::validation, "Name too long");
    return Error{};
}

void GuestService::create(const std::string& raw_name, GuestCb cb) {
    std::string name;
    auto err = validate_name(raw_name, name);
    if (err) { cb(err, Guest{}); return; }
    store_->async_insert(name, clock_(), [cb](const Error& e, Guest g) {
        if (!e) observability::log_info("guest_created", {{"id", g.id}});
        cb(e, std::move(g));
    });
}

void GuestService::list(GuestListCb cb) {
    store_->async_list(std::move(cb));
}

void GuestService::update_status(int64_t id, const std::string& status, DoneCb cb) {
    auto st = parse_status(status);
    if (!st) { cb(make_error(errc::validation, "Invalid status")); return; }
    store_->async_update_status(id, *st, [cb, id, st](const Error& e) {
        if (!e) observability::log_info("guest_updated", {{"id", id}, {"status", std::string(to_string(*st))}});
        cb(e);
    });
}

void GuestService::remove(int64_t id, DoneCb cb) {
    store_->async_remove(id, [cb, id](const Error& e) {
        if (!e) observability::log_info("guest_deleted", {{"id", id}});
        cb(e);
    });
}

void GuestService::stats(StatsCb cb) {
    store_->async_stats(std::move(cb));
}

void GuestService::export_all(ExportCb cb) {
    auto clock = clock_;
    store_->async_list_records([cb, clock](const Error& e, std::vector<GuestRecord> records) {
        if (e) { cb(e, GuestExport{}); return; }
        cb(Error{}, GuestExport{clock(), std::move(records)});
    });
}

}
