//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_ENCODING_TABLE_HPP
#define BOOST_ENCODE_SETS_ENCODING_TABLE_HPP

#include <boost/encode_sets/detail/config.hpp>
#include <boost/encode_sets/encode_set.hpp>
#include <boost/core/detail/string_view.hpp>
#include <array>
#include <cstddef>

namespace boost {
namespace encode_sets {

class encoding_table;

/** The representation of one byte in an encoding table.

    An entry is either the literal character for the
    byte, or its percent-escape `%XX` with two uppercase
    hexadecimal digits. The text is stored inline.

    @par Example
    @code
    table_entry const& e = get_table( set_id::query )[ '\'' ];
    assert( e.escaped() );
    assert( e.str() == "%27" );
    assert( e.value() == '\'' );
    @endcode
*/
class table_entry
{
    char buf_[3];
    unsigned char size_;

public:
    /** Default constructor.

        Constructs an empty entry.
    */
    table_entry() noexcept
        : size_(0)
    {
    }

    /** Return true if the entry is a percent-escape.
    */
    bool
    escaped() const noexcept
    {
        return size_ == 3;
    }

    /** Return the byte this entry represents.
    */
    BOOST_ENCODE_SETS_DECL
    unsigned char
    value() const noexcept;

    /** Return the text of the entry.
    */
    core::string_view
    str() const noexcept
    {
        return core::string_view(buf_, size_);
    }

    /** Implicit conversion to string_view.
    */
    operator core::string_view() const noexcept
    {
        return str();
    }

    /** Return the size of the text (1 or 3).
    */
    std::size_t
    size() const noexcept
    {
        return size_;
    }

    friend
    bool
    operator==(
        table_entry const& a,
        table_entry const& b) noexcept
    {
        return a.str() == b.str();
    }

    friend
    bool
    operator!=(
        table_entry const& a,
        table_entry const& b) noexcept
    {
        return !(a == b);
    }

private:
    friend BOOST_ENCODE_SETS_DECL
        encoding_table build_table(encode_set const&);

    void set_literal(char c) noexcept
    {
        buf_[0] = c;
        size_ = 1;
    }

    BOOST_ENCODE_SETS_DECL
    void set_escaped(unsigned char c) noexcept;
};

//------------------------------------------------

/** A 256-entry lookup table for one encode set.

    Entry `i` is the text that byte `i` takes in the
    context of the set the table was built from. A
    downstream encoder looks up `table[b]` and emits
    the result without further processing.

    @see @ref build_table, @ref get_table.
*/
class encoding_table
{
    std::array<table_entry, 256> v_;

    encoding_table() = default;

public:
    /// Iterator type
    using const_iterator = table_entry const*;

    /** Return the number of entries.
    */
    static
    constexpr
    std::size_t
    size() noexcept
    {
        return 256;
    }

    /** Return the entry for a byte.
    */
    table_entry const&
    operator[](unsigned char b) const noexcept
    {
        return v_[b];
    }

    /** Return true if a byte is percent-encoded.
    */
    bool
    is_escaped(unsigned char b) const noexcept
    {
        return v_[b].escaped();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.data();
    }

    const_iterator
    end() const noexcept
    {
        return v_.data() + v_.size();
    }

    friend
    bool
    operator==(
        encoding_table const& a,
        encoding_table const& b) noexcept
    {
        return a.v_ == b.v_;
    }

    friend
    bool
    operator!=(
        encoding_table const& a,
        encoding_table const& b) noexcept
    {
        return !(a == b);
    }

private:
    friend BOOST_ENCODE_SETS_DECL
        encoding_table build_table(encode_set const&);
};

/** Build the encoding table for an encode set.

    For each byte value, the entry is the literal
    character if the byte is printable ASCII and not
    escaped by `s`, otherwise `%XX`.

    The result depends only on the escaped characters
    of `s`; building twice yields equal tables.

    @par Example
    @code
    encode_set s( "PATH", "?{}" );
    encoding_table t = build_table( s );
    assert( t[ 'A' ].str() == "A" );
    assert( t[ '{' ].str() == "%7B" );
    @endcode
*/
BOOST_ENCODE_SETS_DECL
encoding_table
build_table(encode_set const& s);

/** Return the table for a predefined encode set.

    Each table is built on first use and lives for
    the remainder of the program.
*/
BOOST_ENCODE_SETS_DECL
encoding_table const&
get_table(set_id id);

} // encode_sets
} // boost

#endif
