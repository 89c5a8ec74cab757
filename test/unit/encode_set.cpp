//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/encode_sets/encode_set.hpp>

#include <boost/core/lightweight_test.hpp>
#include <boost/system/system_error.hpp>

namespace boost {
namespace encode_sets {

struct encode_set_test
{
    static
    bool
    escapes(set_id id, char c)
    {
        return get_encode_set(id).escapes(c);
    }

    void
    test_baseline()
    {
        for(auto id : all_set_ids)
        {
            encode_set const& s = get_encode_set(id);
            for(unsigned i = 0; i < 0x20; ++i)
                BOOST_TEST(s.escapes(static_cast<unsigned char>(i)));
            BOOST_TEST(s.escapes(static_cast<unsigned char>(0x7f)));
            for(unsigned i = 0x80; i < 0x100; ++i)
                BOOST_TEST(s.escapes(static_cast<unsigned char>(i)));

            BOOST_TEST(s.escapes(' '));
            BOOST_TEST(s.escapes('"'));
            BOOST_TEST(s.escapes('#'));
            BOOST_TEST(s.escapes('<'));
            BOOST_TEST(s.escapes('>'));
            BOOST_TEST(s.escapes('`'));

            // alphanumerics are never escaped
            for(char c = '0'; c <= '9'; ++c)
                BOOST_TEST(! s.escapes(c));
            for(char c = 'A'; c <= 'Z'; ++c)
                BOOST_TEST(! s.escapes(c));
            for(char c = 'a'; c <= 'z'; ++c)
                BOOST_TEST(! s.escapes(c));
        }
    }

    void
    test_simple()
    {
        // only the baseline
        encode_set const& s = get_encode_set(set_id::simple);
        BOOST_TEST(s.extras().empty());
        for(unsigned i = 0; i < 256; ++i)
        {
            auto const c = static_cast<unsigned char>(i);
            BOOST_TEST_EQ(
                s.escapes(c),
                encode_set::baseline()(c));
        }
    }

    void
    test_extras()
    {
        BOOST_TEST(escapes(set_id::query, '\''));
        BOOST_TEST(! escapes(set_id::query, '@'));
        BOOST_TEST(! escapes(set_id::query, '?'));

        BOOST_TEST(escapes(set_id::default_, '?'));
        BOOST_TEST(escapes(set_id::default_, '{'));
        BOOST_TEST(escapes(set_id::default_, '}'));
        BOOST_TEST(! escapes(set_id::default_, '\''));
        BOOST_TEST(! escapes(set_id::default_, '@'));

        BOOST_TEST(escapes(set_id::userinfo, '@'));
        BOOST_TEST(! escapes(set_id::userinfo, '/'));

        BOOST_TEST(escapes(set_id::password, '\\'));
        BOOST_TEST(escapes(set_id::password, '/'));
        BOOST_TEST(! escapes(set_id::password, ':'));

        BOOST_TEST(escapes(set_id::username, ':'));
        BOOST_TEST(escapes(set_id::username, '@'));

        BOOST_TEST(escapes(set_id::form_urlencoded, '~'));
        BOOST_TEST(escapes(set_id::form_urlencoded, '%'));
        BOOST_TEST(escapes(set_id::form_urlencoded, '+'));
        BOOST_TEST(escapes(set_id::form_urlencoded, '&'));
        BOOST_TEST(! escapes(set_id::form_urlencoded, '*'));
        BOOST_TEST(! escapes(set_id::form_urlencoded, '-'));

        BOOST_TEST(escapes(set_id::http_value, '%'));
        BOOST_TEST(escapes(set_id::http_value, '-'));
        BOOST_TEST(escapes(set_id::http_value, '*'));
        BOOST_TEST(! escapes(set_id::http_value, '@'));
        BOOST_TEST(! escapes(set_id::http_value, '!'));

        BOOST_TEST(escapes(set_id::unreserved, '*'));
        BOOST_TEST(escapes(set_id::unreserved, '%'));
        BOOST_TEST(! escapes(set_id::unreserved, '~'));
        BOOST_TEST(! escapes(set_id::unreserved, '-'));
        BOOST_TEST(! escapes(set_id::unreserved, '.'));
        BOOST_TEST(! escapes(set_id::unreserved, '_'));
    }

    void
    test_names()
    {
        for(auto id : all_set_ids)
        {
            auto rv = parse_set_id(to_string(id));
            BOOST_TEST(rv.has_value());
            if(rv.has_value())
                BOOST_TEST(*rv == id);
            BOOST_TEST_EQ(get_encode_set(id).name(), to_string(id));
        }

        BOOST_TEST_EQ(to_string(set_id::default_), "DEFAULT");
        BOOST_TEST_EQ(to_string(set_id::form_urlencoded), "FORM_URLENCODED");

        // case-insensitive
        {
            auto rv = parse_set_id("http_Value");
            BOOST_TEST(rv.has_value());
            if(rv.has_value())
                BOOST_TEST(*rv == set_id::http_value);
        }

        // unknown
        {
            auto rv = parse_set_id("PATH");
            BOOST_TEST(rv.has_error());
            if(rv.has_error())
                BOOST_TEST(rv.error() == error::unknown_set);
        }
        {
            auto rv = parse_set_id("");
            BOOST_TEST(rv.has_error());
        }
        {
            auto rv = parse_set_id("QUERY ");
            BOOST_TEST(rv.has_error());
        }
    }

    void
    test_validate_extras()
    {
        BOOST_TEST(! validate_extras("").failed());
        BOOST_TEST(! validate_extras("?{}@\\/:").failed());
        BOOST_TEST(! validate_extras(" \"#<>`").failed());

        BOOST_TEST(validate_extras("\t") == error::invalid_char);
        BOOST_TEST(validate_extras("ab\x7f") == error::invalid_char);
        BOOST_TEST(validate_extras("\xc3\xa9") == error::invalid_char);
        BOOST_TEST(validate_extras(
            core::string_view("a\0b", 3)) == error::invalid_char);
        BOOST_TEST(validate_extras("?{}?") == error::duplicate_char);
        BOOST_TEST(validate_extras("\\\\") == error::duplicate_char);

        static_assert(detail::check_extras("?{}") == error::ok, "");
        static_assert(detail::check_extras("??") == error::duplicate_char, "");
        static_assert(detail::check_extras("\n") == error::invalid_char, "");
    }

    void
    test_construct()
    {
        encode_set s("PATH", "?{}");
        BOOST_TEST_EQ(s.name(), "PATH");
        BOOST_TEST_EQ(s.extras(), "?{}");
        for(unsigned i = 0; i < 256; ++i)
        {
            auto const c = static_cast<unsigned char>(i);
            BOOST_TEST_EQ(
                s.escapes(c),
                get_encode_set(set_id::default_).escapes(c));
        }

        // listing a baseline character is harmless
        encode_set s2("X", "<>");
        BOOST_TEST(s2.is_subset_of(get_encode_set(set_id::simple)));

        BOOST_TEST_THROWS(
            encode_set("X", "\x01"),
            system::system_error);

        try
        {
            encode_set("X", "@@");
            BOOST_ERROR("expected system_error");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::duplicate_char);
        }
    }

    void
    test_subset()
    {
        auto const& simple = get_encode_set(set_id::simple);
        for(auto id : all_set_ids)
        {
            BOOST_TEST(simple.is_subset_of(get_encode_set(id)));
            BOOST_TEST(get_encode_set(id).is_subset_of(get_encode_set(id)));
        }

        auto const& def = get_encode_set(set_id::default_);
        auto const& userinfo = get_encode_set(set_id::userinfo);
        auto const& password = get_encode_set(set_id::password);
        auto const& username = get_encode_set(set_id::username);
        auto const& query = get_encode_set(set_id::query);

        BOOST_TEST(def.is_subset_of(userinfo));
        BOOST_TEST(userinfo.is_subset_of(password));
        BOOST_TEST(password.is_subset_of(username));
        BOOST_TEST(def.is_subset_of(username));

        BOOST_TEST(! username.is_subset_of(password));
        BOOST_TEST(! query.is_subset_of(def));
        BOOST_TEST(! def.is_subset_of(query));
    }

    void
    run()
    {
        test_baseline();
        test_simple();
        test_extras();
        test_names();
        test_validate_extras();
        test_construct();
        test_subset();
    }
};

} // encode_sets
} // boost

int
main()
{
    boost::encode_sets::encode_set_test().run();
    return boost::report_errors();
}
