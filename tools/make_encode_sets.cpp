//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Writes the percent-encoding tables as C++ source.
//
//  make_encode_sets > encode_sets.ipp
//  make_encode_sets -n my::tables --set QUERY --set USERNAME -o tables.ipp

#include <boost/encode_sets.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace es = boost::encode_sets;
namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace po = boost::program_options;

namespace {

struct args
{
    std::string output;
    std::vector<std::string> sets;
    es::emit_config cfg;
    bool verbose = false;
    bool help = false;
};

std::optional<args>
parse_command_line(int argc, char const* const argv[])
{
    args a;
    po::options_description desc{"Usage: make_encode_sets [options]"};
    auto add = desc.add_options();
    add("help,h", "produce help message");
    add("output,o", po::value(&a.output)->value_name("file"),
        "write to file instead of stdout");
    add("namespace,n", po::value(&a.cfg.namespace_name)->value_name("ns"),
        "enclose the arrays in a namespace");
    add("per-line", po::value(&a.cfg.entries_per_line)
        ->default_value(a.cfg.entries_per_line)->value_name("n"),
        "entries on each line");
    add("set", po::value(&a.sets)->composing()->value_name("name"),
        "emit only the named set (repeatable)");
    add("verbose,v", po::bool_switch(&a.verbose),
        "enable debug logging");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if(vm.count("help"))
        {
            std::cout << desc << '\n';
            a.help = true;
            return a;
        }
        po::notify(vm);
    }
    catch(po::error const& e)
    {
        std::cerr << "Error: " << e.what() << '\n';
        std::cerr << desc << '\n';
        return std::nullopt;
    }
    return a;
}

void
init_logging(bool verbose)
{
    logging::add_console_log(
        std::clog,
        keywords::format = (
            expr::stream
                << "[" << expr::format_date_time<
                    boost::posix_time::ptime>(
                        "TimeStamp", "%Y-%m-%d %H:%M:%S")
                << "] <" << logging::trivial::severity
                << "> " << expr::smessage));
    logging::add_common_attributes();
    logging::core::get()->set_filter(
        logging::trivial::severity >= (verbose
            ? logging::trivial::debug
            : logging::trivial::info));
}

int
run(args const& a)
{
    std::vector<es::set_id> ids;
    if(a.sets.empty())
    {
        ids.assign(
            std::begin(es::all_set_ids),
            std::end(es::all_set_ids));
    }
    for(auto const& name : a.sets)
    {
        auto rv = es::parse_set_id(name);
        if(rv.has_error())
        {
            BOOST_LOG_TRIVIAL(error)
                << name << ": " << rv.error().message();
            return 1;
        }
        if(std::find(ids.begin(), ids.end(), *rv) != ids.end())
        {
            BOOST_LOG_TRIVIAL(warning)
                << name << ": set already selected, skipping";
            continue;
        }
        ids.push_back(*rv);
    }

    for(auto id : ids)
        BOOST_LOG_TRIVIAL(debug)
            << "emitting " << es::to_string(id);
    std::string const text = es::format_tables(ids, a.cfg);

    if(a.output.empty())
    {
        std::cout << text;
        std::cout.flush();
        if(! std::cout)
        {
            BOOST_LOG_TRIVIAL(error) << "failed writing stdout";
            return 1;
        }
        BOOST_LOG_TRIVIAL(info)
            << "wrote " << ids.size() << " tables to stdout";
        return 0;
    }

    std::ofstream f(a.output, std::ios::binary);
    if(! f)
    {
        BOOST_LOG_TRIVIAL(error)
            << a.output << ": cannot open for writing";
        return 1;
    }
    f << text;
    f.close();
    if(! f)
    {
        BOOST_LOG_TRIVIAL(error)
            << a.output << ": write failed";
        return 1;
    }
    BOOST_LOG_TRIVIAL(info)
        << "wrote " << ids.size() << " tables to " << a.output;
    return 0;
}

} // (anon)

int
main(int argc, char* argv[])
{
    auto a = parse_command_line(argc, argv);
    if(! a)
        return 1;
    if(a->help)
        return 0;
    init_logging(a->verbose);
    try
    {
        return run(*a);
    }
    catch(std::exception const& e)
    {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 1;
    }
}
