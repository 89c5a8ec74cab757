//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_DETAIL_EXCEPT_HPP
#define BOOST_ENCODE_SETS_DETAIL_EXCEPT_HPP

#include <boost/encode_sets/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace encode_sets {
namespace detail {

BOOST_NORETURN
BOOST_ENCODE_SETS_DECL
void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail
} // encode_sets
} // boost

#endif
