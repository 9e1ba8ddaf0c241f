#include "store/StoreError.h"

#include <string>

namespace livestate::store {

namespace {

class StoreCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "livestate.store"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::not_found:   return "document not found";
            case errc::unavailable: return "store unavailable";
            case errc::conflict:    return "revision conflict";
        }
        return "unknown store error";
    }
};

} // namespace

const boost::system::error_category& store_category() noexcept {
    static const StoreCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), store_category()};
}

} // namespace livestate::store
