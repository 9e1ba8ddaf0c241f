#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace livestate::store {

enum class errc {
    not_found = 1,
    unavailable,
    conflict,
};

const boost::system::error_category& store_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Transient failures are the only ones worth retrying.
inline bool is_transient(const boost::system::error_code& ec) noexcept {
    return ec == make_error_code(errc::unavailable);
}

} // namespace livestate::store

namespace boost::system {

template <>
struct is_error_code_enum<livestate::store::errc> : std::true_type {};

} // namespace boost::system
