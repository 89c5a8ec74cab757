//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ENCODE_SETS_HPP
#define BOOST_ENCODE_SETS_HPP

#include <boost/encode_sets/emit.hpp>
#include <boost/encode_sets/encode_set.hpp>
#include <boost/encode_sets/encoding_table.hpp>
#include <boost/encode_sets/error.hpp>

#endif
