#pragma once

#include <functional>
#include <memory>
#include <string>
#include "GuestStore.h"

namespace guests {

using ExportCb = std::function<void(const Error&, GuestExport)>;

// Validates input, issues exactly one store call per operation and hands the
// classified outcome back. Validation failures complete before the store is
// touched.
class GuestService {
public:
    using Clock = std::function<std::string()>;

    explicit GuestService(std::shared_ptr<GuestStore> store, Clock clock = local_iso_timestamp);

    void create(const std::string& raw_name, GuestCb cb);
    void list(GuestListCb cb);
    void update_status(int64_t id, const std::string& status, DoneCb cb);
    void remove(int64_t id, DoneCb cb);
    void stats(StatsCb cb);
    void export_all(ExportCb cb);

    // Trimmed name or a validation error.
    static Error validate_name(const std::string& raw_name, std::string& out);

private:
    std::shared_ptr<GuestStore> store_;
    Clock clock_;
};

}
