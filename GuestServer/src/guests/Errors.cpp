#include "Errors.h"

namespace guests {

namespace {

class GuestCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "guests"; }
    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::validation: return "validation error";
            case errc::conflict: return "conflict";
            case errc::not_found: return "not found";
            case errc::internal: return "internal error";
        }
        return "unknown guests error";
    }
};

}

const boost::system::error_category& guest_category() noexcept {
    static const GuestCategory cat;
    return cat;
}

}
