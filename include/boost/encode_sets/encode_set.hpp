//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_ENCODE_SET_HPP
#define BOOST_ENCODE_SETS_ENCODE_SET_HPP

#include <boost/encode_sets/detail/config.hpp>
#include <boost/encode_sets/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <cstddef>

namespace boost {
namespace encode_sets {

/** Identifies one of the predefined encode sets.

    Each value names a URL sub-context with its own
    rules about which printable characters must be
    percent-encoded.

    @see @ref get_encode_set, @ref to_string,
         @ref parse_set_id.
*/
enum class set_id
{
    /// Baseline only
    simple,

    /// Query string
    query,

    /// Path and other components
    default_,

    /// Userinfo as a whole
    userinfo,

    /// Password in userinfo
    password,

    /// Username in userinfo
    username,

    /// application/x-www-form-urlencoded bodies
    form_urlencoded,

    /// HTTP header parameter values
    http_value,

    /// Everything except unreserved characters
    unreserved
};

/// The number of predefined encode sets.
constexpr std::size_t set_count = 9;

/// Every @ref set_id, in declaration order.
constexpr set_id all_set_ids[set_count] = {
    set_id::simple,
    set_id::query,
    set_id::default_,
    set_id::userinfo,
    set_id::password,
    set_id::username,
    set_id::form_urlencoded,
    set_id::http_value,
    set_id::unreserved
};

/** Return the canonical name of an encode set.

    The name is the uppercase spelling used for the
    generated table, for example `"FORM_URLENCODED"`.
*/
BOOST_ENCODE_SETS_DECL
core::string_view
to_string(set_id id) noexcept;

/** Look up an encode set by name.

    The comparison ignores ASCII case.

    @return The id, or @ref error::unknown_set.
*/
BOOST_ENCODE_SETS_DECL
system::result<set_id>
parse_set_id(core::string_view name) noexcept;

namespace detail {

constexpr
bool
is_printable(char c) noexcept
{
    return c >= 0x20 && c <= 0x7e;
}

// Checks a null-terminated list of extra characters.
// Usable in a constant expression.
constexpr
error
check_extras(char const* s) noexcept
{
    for(std::size_t i = 0; s[i] != '\0'; ++i)
    {
        if(! is_printable(s[i]))
            return error::invalid_char;
        for(std::size_t j = 0; j < i; ++j)
            if(s[j] == s[i])
                return error::duplicate_char;
    }
    return error::ok;
}

} // detail

/** Check a list of extra characters.

    Every character must be printable ASCII
    (0x20 to 0x7E inclusive) and appear at most once.

    @return @ref error::invalid_char,
            @ref error::duplicate_char, or a
            default-constructed error code on success.
*/
BOOST_ENCODE_SETS_DECL
system::error_code
validate_extras(core::string_view extras) noexcept;

/** A named set of characters that require percent-encoding.

    The set is the union of a universal baseline and a
    list of extra printable characters. The baseline holds
    every byte outside 0x20 to 0x7E, plus space, `"`, `#`,
    `<`, `>` and backtick.

    Objects of this type are immutable. The predefined sets
    are obtained from @ref get_encode_set.

    @par Example
    @code
    encode_set const& s = get_encode_set( set_id::query );
    assert( s.escapes( '\'' ) );
    assert( ! s.escapes( '@' ) );
    @endcode
*/
class encode_set
{
    core::string_view name_;
    core::string_view extras_;
    grammar::lut_chars escaped_;

public:
    /** Constructor.

        The strings are referenced, not copied; they
        must remain valid for the lifetime of the set.

        @param name The name of the set.

        @param extras The characters escaped in
        addition to the baseline.

        @throw system::system_error `extras` is
        malformed. See @ref validate_extras.
    */
    BOOST_ENCODE_SETS_DECL
    encode_set(
        core::string_view name,
        core::string_view extras);

    /** Return the name of the set.
    */
    core::string_view
    name() const noexcept
    {
        return name_;
    }

    /** Return the extra characters, as given.
    */
    core::string_view
    extras() const noexcept
    {
        return extras_;
    }

    /** Return the resolved set of escaped characters.
    */
    grammar::lut_chars const&
    escaped_chars() const noexcept
    {
        return escaped_;
    }

    /** Return true if a byte must be percent-encoded.
    */
    bool
    escapes(unsigned char c) const noexcept
    {
        return escaped_(c);
    }

    /// @copydoc escapes(unsigned char) const
    bool
    escapes(char c) const noexcept
    {
        return escaped_(c);
    }

    /** Return true if every byte escaped here is escaped by `other`.
    */
    BOOST_ENCODE_SETS_DECL
    bool
    is_subset_of(
        encode_set const& other) const noexcept;

    /** Return the baseline escaped by every set.
    */
    BOOST_ENCODE_SETS_DECL
    static
    grammar::lut_chars const&
    baseline() noexcept;
};

/** Return a predefined encode set.
*/
BOOST_ENCODE_SETS_DECL
encode_set const&
get_encode_set(set_id id) noexcept;

} // encode_sets
} // boost

#endif
