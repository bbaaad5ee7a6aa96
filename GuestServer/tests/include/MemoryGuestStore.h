#pragma once

#include <map>
#include <optional>
#include <string>
#include "guests/GuestStore.h"

// In-process GuestStore: completes every call synchronously, enforces the
// same unique-name and never-reused-id rules as the guests table, and can be
// told to fail the next call with an internal error.
class MemoryGuestStore : public guests::GuestStore {
public:
    void fail_next(std::string message) { fail_next_ = std::move(message); }

    int calls = 0;
    std::map<int64_t, guests::GuestRecord> rows;

    void async_ensure_schema(guests::DoneCb cb) override {
        if (auto e = take_failure()) { cb(*e); return; }
        cb(guests::Error{});
    }

    void async_insert(const std::string& name, const std::string& added_date, guests::GuestCb cb) override {
        if (auto e = take_failure()) { cb(*e, guests::Guest{}); return; }
        for (const auto& p : rows) {
            if (p.second.name == name) { cb(guests::make_error(guests::errc::conflict, "Guest already exists"), guests::Guest{}); return; }
        }
        int64_t id = ++last_id_;
        rows[id] = guests::GuestRecord{id, name, guests::Status::pending, added_date};
        cb(guests::Error{}, guests::Guest{id, name, guests::Status::pending});
    }

    void async_list(guests::GuestListCb cb) override {
        if (auto e = take_failure()) { cb(*e, {}); return; }
        std::vector<guests::Guest> out;
        for (const auto& p : rows) out.push_back(guests::Guest{p.second.id, p.second.name, p.second.status});
        cb(guests::Error{}, std::move(out));
    }

    void async_update_status(int64_t id, guests::Status status, guests::DoneCb cb) override {
        if (auto e = take_failure()) { cb(*e); return; }
        auto it = rows.find(id);
        if (it == rows.end()) { cb(guests::make_error(guests::errc::not_found, "Guest not found")); return; }
        it->second.status = status;
        cb(guests::Error{});
    }

    void async_remove(int64_t id, guests::DoneCb cb) override {
        if (auto e = take_failure()) { cb(*e); return; }
        if (rows.erase(id) == 0) { cb(guests::make_error(guests::errc::not_found, "Guest not found")); return; }
        cb(guests::Error{});
    }

    void async_stats(guests::StatsCb cb) override {
        if (auto e = take_failure()) { cb(*e, guests::GuestStats{}); return; }
        guests::GuestStats s;
        for (const auto& p : rows) {
            ++s.total;
            switch (p.second.status) {
                case guests::Status::pending: ++s.pending; break;
                case guests::Status::confirmed: ++s.confirmed; break;
                case guests::Status::declined: ++s.declined; break;
            }
        }
        cb(guests::Error{}, s);
    }

    void async_list_records(guests::RecordListCb cb) override {
        if (auto e = take_failure()) { cb(*e, {}); return; }
        std::vector<guests::GuestRecord> out;
        for (const auto& p : rows) out.push_back(p.second);
        cb(guests::Error{}, std::move(out));
    }

private:
    std::optional<guests::Error> take_failure() {
        ++calls;
        if (!fail_next_) return std::nullopt;
        auto e = guests::make_error(guests::errc::internal, *fail_next_);
        fail_next_.reset();
        return e;
    }

    int64_t last_id_ = 0;
    std::optional<std::string> fail_next_;
};
