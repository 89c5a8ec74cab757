//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/encode_sets/emit.hpp>
#include <boost/encode_sets/detail/except.hpp>
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <iterator>

namespace boost {
namespace encode_sets {

namespace {

constexpr grammar::lut_chars ident_chars =
    grammar::lut_chars(grammar::alnum_chars) +
    grammar::lut_chars('_');

// one or more identifiers separated by "::"
bool
is_namespace_name(core::string_view ns) noexcept
{
    for(;;)
    {
        auto const n = ns.find("::");
        auto const id = ns.substr(0, n);
        auto const end = id.data() + id.size();
        if( id.empty() ||
            grammar::digit_chars(id.front()) ||
            grammar::find_if_not(
                id.data(), end, ident_chars) != end)
            return false;
        if(n == core::string_view::npos)
            return true;
        ns.remove_prefix(n + 2);
    }
}

void
check_config(emit_config const& cfg)
{
    if(cfg.entries_per_line == 0)
        detail::throw_system_error(
            error::invalid_config);
    if( ! cfg.namespace_name.empty() &&
        ! is_namespace_name(cfg.namespace_name))
        detail::throw_system_error(
            error::invalid_config);
}

} // (anon)

std::string
quote_entry(table_entry const& e)
{
    std::string s;
    s.reserve(e.size() + 3);
    s.push_back('"');
    core::string_view const sv = e.str();
    if( ! e.escaped() &&
        ( sv[0] == '\\' || sv[0] == '"' ))
        s.push_back('\\');
    s.append(sv.data(), sv.size());
    s.push_back('"');
    return s;
}

std::string
format_table(
    core::string_view name,
    encoding_table const& t,
    emit_config const& cfg)
{
    check_config(cfg);

    // render the entries first so that a
    // short table produces no output at all
    std::string body;
    std::size_t n = 0;
    for(auto const& e : t)
    {
        if(n % cfg.entries_per_line == 0)
        {
            if(n != 0)
                body.push_back('\n');
            body.append(cfg.indent);
        }
        else
        {
            body.push_back(' ');
        }
        body.append(quote_entry(e));
        body.push_back(',');
        ++n;
    }
    if(n != encoding_table::size())
        detail::throw_system_error(
            error::incomplete_table);

    std::string s;
    s.append("constexpr char const* ");
    s.append(name.data(), name.size());
    s.append("[256] = {\n");
    s.append(body);
    s.append("\n};\n");
    return s;
}

std::string
format_tables(
    std::vector<set_id> const& ids,
    emit_config const& cfg)
{
    check_config(cfg);

    std::string s;
    if(cfg.banner)
        s.append("// Generated by make_encode_sets\n\n");
    if(! cfg.namespace_name.empty())
    {
        s.append("namespace ");
        s.append(cfg.namespace_name);
        s.append(" {\n\n");
    }
    for(std::size_t i = 0; i < ids.size(); ++i)
    {
        if(i != 0)
            s.push_back('\n');
        s.append(format_table(
            to_string(ids[i]),
            get_table(ids[i]),
            cfg));
    }
    if(! cfg.namespace_name.empty())
    {
        s.append("\n} // ");
        s.append(cfg.namespace_name);
        s.push_back('\n');
    }
    return s;
}

std::string
format_tables(
    emit_config const& cfg)
{
    return format_tables(
        std::vector<set_id>(
            std::begin(all_set_ids),
            std::end(all_set_ids)),
        cfg);
}

} // encode_sets
} // boost
