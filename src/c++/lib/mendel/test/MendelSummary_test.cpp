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

#include "mendel/MendelErrors.hh"
#include "mendel/MendelSummary.hh"

#include "common/Exceptions.hh"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_MendelSummary )


BOOST_AUTO_TEST_CASE( test_mendel_error_summary )
{
    using namespace trioscan::common;

    const GenotypeArray parents(GenotypeArray::nested_t
    {
        {{0, 0}, {0, 0}},
        {{0, 0}, {1, 1}},
        {{0, 1}, {0, 1}},
        {{-1, -1}, {0, 0}},
    });
    const GenotypeArray progeny(GenotypeArray::nested_t
    {
        {{1, 1}, {0, 1}, {0, 0}},
        {{0, 1}, {0, 0}, {1, 1}},
        {{0, 0}, {1, 1}, {0, 1}},
        {{2, 2}, {2, 2}, {2, 2}},
    });

    const MendelErrorSummary summary(getMendelErrors(parents, progeny));

    BOOST_REQUIRE_EQUAL(summary.variantCount(), 4u);
    BOOST_REQUIRE_EQUAL(summary.progenyCount(), 3u);
    BOOST_REQUIRE_EQUAL(summary.getProgenyErrorCount(0), 2u);
    BOOST_REQUIRE_EQUAL(summary.getProgenyErrorCount(1), 2u);
    BOOST_REQUIRE_EQUAL(summary.getProgenyErrorCount(2), 1u);
    BOOST_REQUIRE_EQUAL(summary.getVariantErrorCount(0), 3u);
    BOOST_REQUIRE_EQUAL(summary.getVariantErrorCount(1), 2u);
    BOOST_REQUIRE_EQUAL(summary.getVariantErrorCount(2), 0u);
    BOOST_REQUIRE_EQUAL(summary.getVariantErrorCount(3), 0u);
    BOOST_REQUIRE_EQUAL(summary.getTotalErrorCount(), 5u);
    BOOST_REQUIRE_EQUAL(summary.getErrorVariantCount(), 2u);

    BOOST_REQUIRE_THROW(summary.getProgenyErrorCount(3), InvalidParameterException);
    BOOST_REQUIRE_THROW(summary.getVariantErrorCount(4), InvalidParameterException);

    std::ostringstream oss;
    summary.report(oss);
    BOOST_REQUIRE_EQUAL(oss.str(), "#progenyIndex\tmendelErrors\n0\t2\n1\t2\n2\t1\n#totalErrors\t5\n#errorVariants\t2\t4\n");
}



BOOST_AUTO_TEST_CASE( test_painting_summary )
{
    using namespace INHERITANCE_STATE;
    using namespace trioscan::common;

    PaintingArray painting(boost::extents[3][2]);
    painting[0][0] = PARENT1;
    painting[1][0] = PARENT1;
    painting[2][0] = MISSING;
    painting[0][1] = PARENT2;
    painting[1][1] = NONSEG_REF;
    painting[2][1] = NONSEG_REF;

    const TransmissionPaintingSummary summary(painting);

    BOOST_REQUIRE_EQUAL(summary.progenyCount(), 2u);
    BOOST_REQUIRE_EQUAL(summary.getStateCount(0, PARENT1), 2u);
    BOOST_REQUIRE_EQUAL(summary.getStateCount(0, MISSING), 1u);
    BOOST_REQUIRE_EQUAL(summary.getStateCount(0, PARENT2), 0u);
    BOOST_REQUIRE_EQUAL(summary.getStateCount(1, PARENT2), 1u);
    BOOST_REQUIRE_EQUAL(summary.getStateCount(1, NONSEG_REF), 2u);
    BOOST_REQUIRE_THROW(summary.getStateCount(2, PARENT1), InvalidParameterException);

    std::ostringstream oss;
    summary.report(oss);
    BOOST_REQUIRE_EQUAL(oss.str(),
                        "#progenyIndex\tUNDETERMINED\tPARENT1\tPARENT2\tNONSEG_REF\tNONSEG_ALT\tNONPARENTAL\tPARENT_MISSING\tMISSING\n"
                        "0\t0\t2\t0\t0\t0\t0\t0\t1\n"
                        "1\t0\t0\t1\t2\t0\t0\t0\t0\n");

    painting[2][1] = SIZE;
    BOOST_REQUIRE_THROW(TransmissionPaintingSummary invalidSummary(painting), InvalidParameterException);
}


BOOST_AUTO_TEST_SUITE_END()
