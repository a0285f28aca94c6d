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

#include "common/Exceptions.hh"
#include "test/arrayTestUtil.hh"


BOOST_AUTO_TEST_SUITE( test_MendelErrors )


/// split a combined trio table into parents (first two samples) and progeny
static
MendelErrorArray
getTableMendelErrors(
    const GenotypeArray::nested_t& table)
{
    const GenotypeArray genotypes(table);
    return getMendelErrors(genotypes.subsetSamples(0,2), genotypes.subsetSamples(2,genotypes.sampleCount()));
}



BOOST_AUTO_TEST_CASE( test_consistent_transmission )
{
    // missing progeny calls are never errors
    const GenotypeArray::nested_t table =
    {
        // aa x aa -> aa
        {{0, 0}, {0, 0}, {0, 0}, {-1, -1}, {-1, -1}, {-1, -1}},
        {{1, 1}, {1, 1}, {1, 1}, {-1, -1}, {-1, -1}, {-1, -1}},
        {{2, 2}, {2, 2}, {2, 2}, {-1, -1}, {-1, -1}, {-1, -1}},
        // aa x ab -> aa or ab
        {{0, 0}, {0, 1}, {0, 0}, {0, 1}, {-1, -1}, {-1, -1}},
        {{0, 0}, {0, 2}, {0, 0}, {0, 2}, {-1, -1}, {-1, -1}},
        {{1, 1}, {0, 1}, {1, 1}, {0, 1}, {-1, -1}, {-1, -1}},
        // aa x bb -> ab
        {{0, 0}, {1, 1}, {0, 1}, {-1, -1}, {-1, -1}, {-1, -1}},
        {{0, 0}, {2, 2}, {0, 2}, {-1, -1}, {-1, -1}, {-1, -1}},
        {{1, 1}, {2, 2}, {1, 2}, {-1, -1}, {-1, -1}, {-1, -1}},
        // aa x bc -> ab or ac
        {{0, 0}, {1, 2}, {0, 1}, {0, 2}, {-1, -1}, {-1, -1}},
        {{1, 1}, {0, 2}, {0, 1}, {1, 2}, {-1, -1}, {-1, -1}},
        // ab x ab -> aa or ab or bb
        {{0, 1}, {0, 1}, {0, 0}, {0, 1}, {1, 1}, {-1, -1}},
        {{1, 2}, {1, 2}, {1, 1}, {1, 2}, {2, 2}, {-1, -1}},
        {{0, 2}, {0, 2}, {0, 0}, {0, 2}, {2, 2}, {-1, -1}},
        // ab x bc -> ab or ac or bb or bc
        {{0, 1}, {1, 2}, {0, 1}, {0, 2}, {1, 1}, {1, 2}},
        {{0, 1}, {0, 2}, {0, 0}, {0, 1}, {0, 1}, {1, 2}},
        // ab x cd -> ac or ad or bc or bd
        {{0, 1}, {2, 3}, {0, 2}, {0, 3}, {1, 2}, {1, 3}},
    };

    const std::vector<std::vector<int>> expect(table.size(), std::vector<int>(4,0));
    checkArray(getTableMendelErrors(table), expect);
}



BOOST_AUTO_TEST_CASE( test_nonparental_transmission )
{
    const GenotypeArray::nested_t table =
    {
        // aa x aa -> ab or ac or bb or cc
        {{0, 0}, {0, 0}, {0, 1}, {0, 2}, {1, 1}, {2, 2}},
        {{1, 1}, {1, 1}, {0, 1}, {1, 2}, {0, 0}, {2, 2}},
        {{2, 2}, {2, 2}, {0, 2}, {1, 2}, {0, 0}, {1, 1}},
        // aa x ab -> ac or bc or cc
        {{0, 0}, {0, 1}, {0, 2}, {1, 2}, {2, 2}, {2, 2}},
        {{0, 0}, {0, 2}, {0, 1}, {1, 2}, {1, 1}, {1, 1}},
        {{1, 1}, {0, 1}, {1, 2}, {0, 2}, {2, 2}, {2, 2}},
        // aa x bb -> ac or bc or cc
        {{0, 0}, {1, 1}, {0, 2}, {1, 2}, {2, 2}, {2, 2}},
        {{0, 0}, {2, 2}, {0, 1}, {1, 2}, {1, 1}, {1, 1}},
        {{1, 1}, {2, 2}, {0, 1}, {0, 2}, {0, 0}, {0, 0}},
        // ab x ab -> ac or bc or cc
        {{0, 1}, {0, 1}, {0, 2}, {1, 2}, {2, 2}, {2, 2}},
        {{0, 2}, {0, 2}, {0, 1}, {1, 2}, {1, 1}, {1, 1}},
        {{1, 2}, {1, 2}, {0, 1}, {0, 2}, {0, 0}, {0, 0}},
        // ab x bc -> ad or bd or cd or dd
        {{0, 1}, {1, 2}, {0, 3}, {1, 3}, {2, 3}, {3, 3}},
        {{0, 1}, {0, 2}, {0, 3}, {1, 3}, {2, 3}, {3, 3}},
        {{0, 2}, {1, 2}, {0, 3}, {1, 3}, {2, 3}, {3, 3}},
        // ab x cd -> ae or be or ce or de
        {{0, 1}, {2, 3}, {0, 4}, {1, 4}, {2, 4}, {3, 4}},
    };

    const std::vector<std::vector<int>> expect =
    {
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 2, 2},
        {1, 1, 1, 2},
        {1, 1, 1, 2},
        {1, 1, 1, 2},
        {1, 1, 1, 1},
    };
    checkArray(getTableMendelErrors(table), expect);
}



BOOST_AUTO_TEST_CASE( test_hemiparental_transmission )
{
    const GenotypeArray::nested_t table =
    {
        // aa x ab -> bb
        {{0, 0}, {0, 1}, {1, 1}, {-1, -1}},
        {{0, 0}, {0, 2}, {2, 2}, {-1, -1}},
        {{1, 1}, {0, 1}, {0, 0}, {-1, -1}},
        // ab x bc -> aa or cc
        {{0, 1}, {1, 2}, {0, 0}, {2, 2}},
        {{0, 1}, {0, 2}, {1, 1}, {2, 2}},
        {{0, 2}, {1, 2}, {0, 0}, {1, 1}},
        // ab x cd -> aa or bb or cc or dd
        {{0, 1}, {2, 3}, {0, 0}, {1, 1}},
        {{0, 1}, {2, 3}, {2, 2}, {3, 3}},
    };

    const std::vector<std::vector<int>> expect =
    {
        {1, 0},
        {1, 0},
        {1, 0},
        {1, 1},
        {1, 1},
        {1, 1},
        {1, 1},
        {1, 1},
    };
    checkArray(getTableMendelErrors(table), expect);
}



BOOST_AUTO_TEST_CASE( test_uniparental_transmission )
{
    const GenotypeArray::nested_t table =
    {
        // aa x bb -> aa or bb
        {{0, 0}, {1, 1}, {0, 0}, {1, 1}},
        {{0, 0}, {2, 2}, {0, 0}, {2, 2}},
        {{1, 1}, {2, 2}, {1, 1}, {2, 2}},
        // aa x bc -> aa or bc
        {{0, 0}, {1, 2}, {0, 0}, {1, 2}},
        {{1, 1}, {0, 2}, {1, 1}, {0, 2}},
        // ab x cd -> ab or cd
        {{0, 1}, {2, 3}, {0, 1}, {2, 3}},
    };

    const std::vector<std::vector<int>> expect(table.size(), std::vector<int>(2,1));
    checkArray(getTableMendelErrors(table), expect);
}



BOOST_AUTO_TEST_CASE( test_trio_scenarios )
{
    {
        const GenotypeArray parents(GenotypeArray::nested_t{{{0, 0}, {0, 0}}});
        const GenotypeArray progeny(GenotypeArray::nested_t{{{0, 0}}});
        checkArray(getMendelErrors(parents, progeny), {{0}});
    }
    {
        const GenotypeArray parents(GenotypeArray::nested_t{{{0, 0}, {1, 1}}});
        const GenotypeArray progeny(GenotypeArray::nested_t{{{0, 1}, {0, 0}}});
        checkArray(getMendelErrors(parents, progeny), {{0, 1}});
    }
}



BOOST_AUTO_TEST_CASE( test_missing_parent_suppresses_errors )
{
    // every progeny call would otherwise be a non-parental or uni-parental error
    const GenotypeArray::nested_t table =
    {
        {{-1, -1}, {-1, -1}, {1, 1}, {0, 2}, {-1, -1}},
        {{0, 0}, {-1, -1}, {1, 1}, {2, 2}, {0, 0}},
        {{1, 1}, {0, -1}, {2, 2}, {1, 1}, {3, 3}},
        {{-1, 0}, {1, 1}, {0, 0}, {2, 3}, {1, 1}},
    };

    const std::vector<std::vector<int>> expect(table.size(), std::vector<int>(3,0));
    checkArray(getTableMendelErrors(table), expect);
}



BOOST_AUTO_TEST_CASE( test_error_count_range )
{
    // every pairing of diploid calls over a three allele universe
    std::vector<std::vector<int>> calls;
    for (int allele0(-1); allele0<3; ++allele0)
    {
        for (int allele1(-1); allele1<3; ++allele1)
        {
            calls.push_back({allele0, allele1});
        }
    }

    GenotypeArray::nested_t parentTable;
    GenotypeArray::nested_t progenyTable;
    for (const auto& parent1 : calls)
    {
        for (const auto& parent2 : calls)
        {
            parentTable.push_back({parent1, parent2});
            progenyTable.push_back(calls);
        }
    }

    const GenotypeArray parents(parentTable);
    const GenotypeArray progeny(progenyTable);
    const MendelErrorArray errors(getMendelErrors(parents, progeny));
    const CallMask isParentMissing(parents.isMissing());

    BOOST_REQUIRE_EQUAL(errors.shape()[0], parentTable.size());
    BOOST_REQUIRE_EQUAL(errors.shape()[1], calls.size());
    for (unsigned variantIndex(0); variantIndex<parentTable.size(); ++variantIndex)
    {
        const bool isAnyParentMissing(isParentMissing[variantIndex][0] || isParentMissing[variantIndex][1]);
        for (unsigned progenyIndex(0); progenyIndex<calls.size(); ++progenyIndex)
        {
            const int errorCount(errors[variantIndex][progenyIndex]);
            BOOST_CHECK(errorCount <= 2);
            if (isAnyParentMissing) BOOST_CHECK_EQUAL(errorCount, 0);
        }
    }
}



BOOST_AUTO_TEST_CASE( test_preconditions )
{
    using namespace trioscan::common;

    const GenotypeArray parents(GenotypeArray::nested_t{{{0, 0}, {0, 1}}});
    const GenotypeArray progeny(GenotypeArray::nested_t{{{0, 0}, {0, 1}}});

    const GenotypeArray triploidParents(GenotypeArray::nested_t{{{0, 0, 0}, {0, 1, 1}}});
    BOOST_REQUIRE_THROW(getMendelErrors(triploidParents, progeny), PreConditionException);

    const GenotypeArray haploidProgeny(GenotypeArray::nested_t{{{0}, {1}}});
    BOOST_REQUIRE_THROW(getMendelErrors(parents, haploidProgeny), PreConditionException);

    const GenotypeArray singleParent(GenotypeArray::nested_t{{{0, 0}}});
    BOOST_REQUIRE_THROW(getMendelErrors(singleParent, progeny), PreConditionException);

    const GenotypeArray twoVariantProgeny(GenotypeArray::nested_t{{{0, 0}}, {{0, 1}}});
    BOOST_REQUIRE_THROW(getMendelErrors(parents, twoVariantProgeny), InvalidParameterException);
}


BOOST_AUTO_TEST_SUITE_END()
