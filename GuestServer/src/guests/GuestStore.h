#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "Errors.h"
#include "Guest.h"

namespace guests {

using DoneCb = std::function<void(const Error&)>;
using GuestCb = std::function<void(const Error&, Guest)>;
using GuestListCb = std::function<void(const Error&, std::vector<Guest>)>;
using RecordListCb = std::function<void(const Error&, std::vector<GuestRecord>)>;
using StatsCb = std::function<void(const Error&, GuestStats)>;

// Storage for the guests table. Every call is one self-contained unit of
// work and completes exactly once through its callback. Implementations
// classify failures themselves: a duplicate name is errc::conflict, an id
// that matches nothing is errc::not_found, anything else is errc::internal.
class GuestStore {
public:
    virtual ~GuestStore() = default;

    virtual void async_ensure_schema(DoneCb cb) = 0;
    virtual void async_insert(const std::string& name, const std::string& added_date, GuestCb cb) = 0;
    virtual void async_list(GuestListCb cb) = 0;
    virtual void async_update_status(int64_t id, Status status, DoneCb cb) = 0;
    virtual void async_remove(int64_t id, DoneCb cb) = 0;
    virtual void async_stats(StatsCb cb) = 0;
    virtual void async_list_records(RecordListCb cb) = 0;
};

}
