//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/encode_sets/encode_set.hpp>
#include <boost/encode_sets/detail/except.hpp>
#include <boost/assert.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace boost {
namespace encode_sets {

namespace {

struct printable_pred
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return detail::is_printable(c);
    }
};

// Escaped in every context: controls, DEL,
// non-ASCII, space and "#<>`
constexpr grammar::lut_chars baseline_chars =
    ~grammar::lut_chars(printable_pred{}) +
    grammar::lut_chars(" \"#<>`");

// Extra characters escaped by each predefined set
constexpr char simple_extras[]          = "";
constexpr char query_extras[]           = "'";
constexpr char default_extras[]         = "?{}";
constexpr char userinfo_extras[]        = "?{}@";
constexpr char password_extras[]        = "?{}@\\/";
constexpr char username_extras[]        = "?{}@\\/:";
constexpr char form_urlencoded_extras[] = "!$%&'()+,/:;<=>?@[\\]^{|}~";
constexpr char http_value_extras[]      = "%'()*,/:;<->?[\\]{}";
constexpr char unreserved_extras[]      = "!$%&'*()+,/:;<=>?@[\\]^{|}";

static_assert(detail::check_extras(simple_extras) == error::ok,
    "SIMPLE extras are malformed");
static_assert(detail::check_extras(query_extras) == error::ok,
    "QUERY extras are malformed");
static_assert(detail::check_extras(default_extras) == error::ok,
    "DEFAULT extras are malformed");
static_assert(detail::check_extras(userinfo_extras) == error::ok,
    "USERINFO extras are malformed");
static_assert(detail::check_extras(password_extras) == error::ok,
    "PASSWORD extras are malformed");
static_assert(detail::check_extras(username_extras) == error::ok,
    "USERNAME extras are malformed");
static_assert(detail::check_extras(form_urlencoded_extras) == error::ok,
    "FORM_URLENCODED extras are malformed");
static_assert(detail::check_extras(http_value_extras) == error::ok,
    "HTTP_VALUE extras are malformed");
static_assert(detail::check_extras(unreserved_extras) == error::ok,
    "UNRESERVED extras are malformed");

} // (anon)

core::string_view
to_string(set_id id) noexcept
{
    switch(id)
    {
    case set_id::simple: return "SIMPLE";
    case set_id::query: return "QUERY";
    case set_id::default_: return "DEFAULT";
    case set_id::userinfo: return "USERINFO";
    case set_id::password: return "PASSWORD";
    case set_id::username: return "USERNAME";
    case set_id::form_urlencoded: return "FORM_URLENCODED";
    case set_id::http_value: return "HTTP_VALUE";
    case set_id::unreserved: return "UNRESERVED";
    default:
        return "unknown";
    }
}

system::result<set_id>
parse_set_id(core::string_view name) noexcept
{
    for(auto id : all_set_ids)
    {
        if(grammar::ci_is_equal(
                name, to_string(id)))
            return id;
    }
    return BOOST_ENCODE_SETS_ERR(
        error::unknown_set);
}

system::error_code
validate_extras(
    core::string_view extras) noexcept
{
    for(std::size_t i = 0; i < extras.size(); ++i)
    {
        char const c = extras[i];
        if(! detail::is_printable(c))
            BOOST_ENCODE_SETS_RETURN_EC(
                error::invalid_char);
        if(extras.substr(0, i).find(c) !=
                core::string_view::npos)
            BOOST_ENCODE_SETS_RETURN_EC(
                error::duplicate_char);
    }
    return {};
}

//------------------------------------------------

encode_set::
encode_set(
    core::string_view name,
    core::string_view extras)
    : name_(name)
    , extras_(extras)
    , escaped_(baseline_chars)
{
    auto const ec = validate_extras(extras);
    if(ec.failed())
        detail::throw_system_error(ec);
    for(char c : extras)
        escaped_ = escaped_ + grammar::lut_chars(c);
}

bool
encode_set::
is_subset_of(
    encode_set const& other) const noexcept
{
    for(unsigned i = 0; i < 256; ++i)
    {
        auto const c = static_cast<unsigned char>(i);
        if( escaped_(c) &&
            ! other.escaped_(c))
            return false;
    }
    return true;
}

grammar::lut_chars const&
encode_set::
baseline() noexcept
{
    return baseline_chars;
}

//------------------------------------------------

encode_set const&
get_encode_set(set_id id) noexcept
{
    // order matches all_set_ids
    static encode_set const sets[set_count] = {
        { to_string(set_id::simple),          simple_extras },
        { to_string(set_id::query),           query_extras },
        { to_string(set_id::default_),        default_extras },
        { to_string(set_id::userinfo),        userinfo_extras },
        { to_string(set_id::password),        password_extras },
        { to_string(set_id::username),        username_extras },
        { to_string(set_id::form_urlencoded), form_urlencoded_extras },
        { to_string(set_id::http_value),      http_value_extras },
        { to_string(set_id::unreserved),      unreserved_extras },
    };
    BOOST_ASSERT(static_cast<std::size_t>(id) < set_count);
    return sets[static_cast<std::size_t>(id)];
}

} // encode_sets
} // boost
