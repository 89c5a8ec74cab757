//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_EMIT_HPP
#define BOOST_ENCODE_SETS_EMIT_HPP

#include <boost/encode_sets/detail/config.hpp>
#include <boost/encode_sets/encode_set.hpp>
#include <boost/encode_sets/encoding_table.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace boost {
namespace encode_sets {

/** Settings for rendering tables as C++ source.

    @see @ref format_table, @ref format_tables.
*/
struct emit_config
{
    /** Number of entries on each line of an array.

        This cannot be zero.
    */
    std::size_t entries_per_line = 8;

    /** Text placed before each line of entries.
    */
    std::string indent = "    ";

    /** Namespace enclosing the arrays.

        When empty, the arrays are emitted at
        namespace scope of the including file.
    */
    std::string namespace_name;

    /** Emit a comment marking the file as generated.
    */
    bool banner = true;
};

/** Return an entry as a C string literal.

    The result includes the surrounding double quotes.
    A backslash or double quote character is preceded
    by a backslash. This escaping belongs to the output
    format and is unrelated to percent-encoding.

    @par Example
    @code
    quote_entry( get_table( set_id::simple )[ '"' ] );  // "\"%22\""
    quote_entry( get_table( set_id::simple )[ '\\' ] ); // "\"\\\\\""
    @endcode
*/
BOOST_ENCODE_SETS_DECL
std::string
quote_entry(table_entry const& e);

/** Render one table as a C++ array definition.

    The output has the form
    @code
    constexpr char const* NAME[256] = {
        "%00", "%01", ...
    };
    @endcode

    @throw system::system_error @ref error::invalid_config
    if `cfg.entries_per_line` is zero, or
    @ref error::incomplete_table if `t` does not hold
    exactly 256 entries. Nothing is rendered in
    either case.
*/
BOOST_ENCODE_SETS_DECL
std::string
format_table(
    core::string_view name,
    encoding_table const& t,
    emit_config const& cfg = emit_config());

/** Render the tables of some predefined sets.

    The tables appear in the order given, each named
    by @ref to_string.

    @throw system::system_error on the same conditions
    as @ref format_table.
*/
BOOST_ENCODE_SETS_DECL
std::string
format_tables(
    std::vector<set_id> const& ids,
    emit_config const& cfg = emit_config());

/** Render the tables of every predefined set.
*/
BOOST_ENCODE_SETS_DECL
std::string
format_tables(
    emit_config const& cfg = emit_config());

} // encode_sets
} // boost

#endif
