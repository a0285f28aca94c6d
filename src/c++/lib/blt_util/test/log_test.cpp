//
// Trioscan - Trio Transmission Statistics
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "boost/test/unit_test.hpp"

#include "blt_util/log.hh"

#include <iostream>


BOOST_AUTO_TEST_SUITE( test_log )


BOOST_AUTO_TEST_CASE( test_log_stream )
{
    // diagnostic output shares stderr with the rest of the process
    BOOST_REQUIRE(&log_os == &std::cerr);
    log_os << "";
    BOOST_REQUIRE(log_os.good());
}


BOOST_AUTO_TEST_SUITE_END()
