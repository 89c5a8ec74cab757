//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_ERROR_HPP
#define BOOST_ENCODE_SETS_ERROR_HPP

#include <boost/encode_sets/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <system_error>

namespace boost {
namespace encode_sets {

/** Error codes returned by encode set operations.

    None of these can occur when using the predefined
    encode sets; they indicate a malformed user-defined
    set, an unknown set name, or an internal defect.
*/
enum class error
{
    /// Success
    ok = 0,

    /// An extra character is not printable ASCII
    invalid_char,

    /// An extra character is listed more than once
    duplicate_char,

    /// No encode set has the given name
    unknown_set,

    /// A table does not hold exactly 256 entries
    incomplete_table,

    /// An emitter setting is out of range
    invalid_config
};

} // encode_sets

namespace system {
template<>
struct is_error_code_enum<
    ::boost::encode_sets::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::encode_sets::error>
    : std::true_type {};
} // std

namespace boost {
namespace encode_sets {

namespace detail {

struct BOOST_ENCODE_SETS_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_ENCODE_SETS_DECL const char* name(
        ) const noexcept override;
    BOOST_ENCODE_SETS_DECL std::string message(
        int) const override;
    BOOST_ENCODE_SETS_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x5e2c91d04b7a36f1)
    {
    }
};

BOOST_ENCODE_SETS_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // encode_sets
} // boost

#endif
