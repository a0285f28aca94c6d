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

/// \file
///

#include "mendel/MendelErrors.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>


typedef boost::multi_array<int,2> AvailableAlleleCounts;



/// for each variant and allele, the number of copies available for
/// transmission, each parent contributing at most one copy
static
AvailableAlleleCounts
getAvailableAlleleCounts(
    const AlleleCountArray& parentCounts)
{
    const unsigned variantCount(parentCounts.shape()[0]);
    const unsigned parentCount(parentCounts.shape()[1]);
    const unsigned alleleCount(parentCounts.shape()[2]);

    AvailableAlleleCounts available(boost::extents[variantCount][alleleCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
        {
            int count(0);
            for (unsigned parentIndex(0); parentIndex<parentCount; ++parentIndex)
            {
                count += std::min(static_cast<int>(parentCounts[variantIndex][parentIndex][alleleIndex]),1);
            }
            available[variantIndex][alleleIndex] = count;
        }
    }
    return available;
}



/// detect non-parental and hemi-parental inheritance, every progeny allele
/// copy beyond what the parents make available is one error
static
MendelErrorArray
getUnavailableAlleleCounts(
    const AvailableAlleleCounts& available,
    const AlleleCountArray& progenyCounts)
{
    const unsigned variantCount(progenyCounts.shape()[0]);
    const unsigned progenyCount(progenyCounts.shape()[1]);
    const unsigned alleleCount(progenyCounts.shape()[2]);

    MendelErrorArray errors(boost::extents[variantCount][progenyCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            int errorCount(0);
            for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
            {
                const int excess(progenyCounts[variantIndex][progenyIndex][alleleIndex] - available[variantIndex][alleleIndex]);
                errorCount += std::max(excess,0);
            }
            errors[variantIndex][progenyIndex] = errorCount;
        }
    }
    return errors;
}



/// detect uni-parental inheritance: the parents share no allele and the
/// progeny call is identical to one parent
static
CallMask
getUniparentalMask(
    const AlleleCountArray& parentCounts,
    const AlleleCountArray& progenyCounts)
{
    const unsigned variantCount(progenyCounts.shape()[0]);
    const unsigned progenyCount(progenyCounts.shape()[1]);
    const unsigned alleleCount(progenyCounts.shape()[2]);

    VariantMask isNoSharedAllele(variantCount, true);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
        {
            if ((parentCounts[variantIndex][0][alleleIndex] > 0) &&
                (parentCounts[variantIndex][1][alleleIndex] > 0))
            {
                isNoSharedAllele[variantIndex] = false;
                break;
            }
        }
    }

    CallMask isUniparental(boost::extents[variantCount][progenyCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            bool isParent1Match(true);
            bool isParent2Match(true);
            for (unsigned alleleIndex(0); alleleIndex<alleleCount; ++alleleIndex)
            {
                const int callCount(progenyCounts[variantIndex][progenyIndex][alleleIndex]);
                if (callCount != parentCounts[variantIndex][0][alleleIndex]) isParent1Match = false;
                if (callCount != parentCounts[variantIndex][1][alleleIndex]) isParent2Match = false;
            }
            isUniparental[variantIndex][progenyIndex] =
                (isNoSharedAllele[variantIndex] && (isParent1Match || isParent2Match));
        }
    }
    return isUniparental;
}



MendelErrorArray
getMendelErrors(
    const GenotypeArray& parentGenotypes,
    const GenotypeArray& progenyGenotypes)
{
    using namespace trioscan::common;

    assertDiploid(parentGenotypes);
    assertDiploid(progenyGenotypes);
    if (parentGenotypes.sampleCount() != 2)
    {
        std::ostringstream oss;
        oss << "bad parent genotypes: exactly two parents required; found " << parentGenotypes.sampleCount();
        BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
    }
    assertMatchingVariantCount(parentGenotypes.variantCount(), progenyGenotypes.variantCount(), "genotypes");

    // transform into per-call allele counts over a shared allele universe
    const int maxAllele(std::max(parentGenotypes.maxAllele(), progenyGenotypes.maxAllele()));
    const AlleleCountArray parentCounts(parentGenotypes.toAlleleCounts(maxAllele));
    const AlleleCountArray progenyCounts(progenyGenotypes.toAlleleCounts(maxAllele));

    MendelErrorArray errors(getUnavailableAlleleCounts(getAvailableAlleleCounts(parentCounts), progenyCounts));

    // N.B., order in which these are set matters
    setMasked(errors, getUniparentalMask(parentCounts, progenyCounts), 1);

    const VariantMask isParentMissing(anyOverSamples(parentGenotypes.isMissing()));
    setMasked(errors, broadcastVariantMask(isParentMissing, progenyGenotypes.sampleCount()), 0);

    return errors;
}
