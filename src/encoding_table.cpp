//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/encode_sets/encoding_table.hpp>
#include <boost/assert.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>

namespace boost {
namespace encode_sets {

namespace {

constexpr char hex_chars[] = "0123456789ABCDEF";

} // (anon)

unsigned char
table_entry::
value() const noexcept
{
    if(! escaped())
        return static_cast<unsigned char>(buf_[0]);
    auto const d0 = grammar::hexdig_value(buf_[1]);
    auto const d1 = grammar::hexdig_value(buf_[2]);
    return static_cast<unsigned char>(d0 * 16 + d1);
}

void
table_entry::
set_escaped(unsigned char c) noexcept
{
    buf_[0] = '%';
    buf_[1] = hex_chars[c >> 4];
    buf_[2] = hex_chars[c & 0x0F];
    size_ = 3;
}

//------------------------------------------------

encoding_table
build_table(encode_set const& s)
{
    encoding_table t;
    std::size_t n = 0;
    for(unsigned i = 0; i < encoding_table::size(); ++i)
    {
        auto const c = static_cast<unsigned char>(i);
        auto& e = t.v_[i];
        if( detail::is_printable(static_cast<char>(c)) &&
            ! s.escapes(c))
            e.set_literal(static_cast<char>(c));
        else
            e.set_escaped(c);
        ++n;
    }
    BOOST_ASSERT(n == encoding_table::size());
    return t;
}

encoding_table const&
get_table(set_id id)
{
    // order matches all_set_ids
    static encoding_table const tables[set_count] = {
        build_table(get_encode_set(set_id::simple)),
        build_table(get_encode_set(set_id::query)),
        build_table(get_encode_set(set_id::default_)),
        build_table(get_encode_set(set_id::userinfo)),
        build_table(get_encode_set(set_id::password)),
        build_table(get_encode_set(set_id::username)),
        build_table(get_encode_set(set_id::form_urlencoded)),
        build_table(get_encode_set(set_id::http_value)),
        build_table(get_encode_set(set_id::unreserved)),
    };
    BOOST_ASSERT(static_cast<std::size_t>(id) < set_count);
    return tables[static_cast<std::size_t>(id)];
}

} // encode_sets
} // boost
