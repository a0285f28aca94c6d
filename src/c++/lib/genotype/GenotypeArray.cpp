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

#include "genotype/GenotypeArray.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <iostream>
#include <sstream>



static
void
checkPloidy(const unsigned ploidy)
{
    using namespace trioscan::common;

    if (ploidy > 0) return;
    BOOST_THROW_EXCEPTION(InvalidParameterException("Genotype array ploidy must be greater than zero"));
}



GenotypeArray::
GenotypeArray(
    const unsigned variantCount,
    const unsigned sampleCount,
    const unsigned ploidy)
    : _data(boost::extents[variantCount][sampleCount][ploidy])
{
    checkPloidy(ploidy);
    std::fill_n(_data.data(), _data.num_elements(), MISSING_ALLELE);
}



GenotypeArray::
GenotypeArray(
    const nested_t& calls)
{
    using namespace trioscan::common;

    const unsigned variantCount(calls.size());
    const unsigned sampleCount(calls.empty() ? 0 : calls[0].size());
    unsigned ploidy(2);
    if (sampleCount > 0) ploidy = calls[0][0].size();
    checkPloidy(ploidy);

    _data.resize(boost::extents[variantCount][sampleCount][ploidy]);

    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        const auto& variantCalls(calls[variantIndex]);
        if (variantCalls.size() != sampleCount)
        {
            std::ostringstream oss;
            oss << "Inconsistent sample count in genotype array. Variant " << variantIndex
                << " has " << variantCalls.size() << " samples, expected " << sampleCount;
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
        }
        for (unsigned sampleIndex(0); sampleIndex<sampleCount; ++sampleIndex)
        {
            const auto& call(variantCalls[sampleIndex]);
            if (call.size() != ploidy)
            {
                std::ostringstream oss;
                oss << "Inconsistent ploidy in genotype array. Variant " << variantIndex
                    << " sample " << sampleIndex << " has " << call.size()
                    << " alleles, expected " << ploidy;
                BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
            }
            for (unsigned ploidyIndex(0); ploidyIndex<ploidy; ++ploidyIndex)
            {
                _data[variantIndex][sampleIndex][ploidyIndex] = convertAllele(call[ploidyIndex]);
            }
        }
    }
}



GenotypeArray&
GenotypeArray::
operator=(const GenotypeArray& rhs)
{
    if (this == &rhs) return *this;
    // multi_array assignment requires matching shapes:
    _data.resize(boost::extents[rhs.variantCount()][rhs.sampleCount()][rhs.ploidy()]);
    _data = rhs._data;
    return *this;
}



bool
GenotypeArray::
isCallMissing(
    const unsigned variantIndex,
    const unsigned sampleIndex) const
{
    const unsigned ploidyCount(ploidy());
    for (unsigned ploidyIndex(0); ploidyIndex<ploidyCount; ++ploidyIndex)
    {
        if (isMissingAllele(_data[variantIndex][sampleIndex][ploidyIndex])) return true;
    }
    return false;
}



int
GenotypeArray::
maxAllele() const
{
    if (_data.num_elements() == 0) return MISSING_ALLELE;
    const allele_t* begin(_data.data());
    return *std::max_element(begin, begin+_data.num_elements());
}



AlleleCountArray
GenotypeArray::
toAlleleCounts(
    const int maxAllele) const
{
    const unsigned alleleCount(std::max(maxAllele+1,0));
    AlleleCountArray counts(boost::extents[variantCount()][sampleCount()][alleleCount]);
    std::fill_n(counts.data(), counts.num_elements(), 0);

    for (unsigned variantIndex(0); variantIndex<variantCount(); ++variantIndex)
    {
        for (unsigned sampleIndex(0); sampleIndex<sampleCount(); ++sampleIndex)
        {
            for (unsigned ploidyIndex(0); ploidyIndex<ploidy(); ++ploidyIndex)
            {
                const allele_t allele(_data[variantIndex][sampleIndex][ploidyIndex]);
                if (isMissingAllele(allele)) continue;
                if (static_cast<unsigned>(allele) >= alleleCount) continue;
                counts[variantIndex][sampleIndex][allele] += 1;
            }
        }
    }
    return counts;
}



CallMask
GenotypeArray::
getCallMask(call_predicate_t predicate) const
{
    CallMask mask(boost::extents[variantCount()][sampleCount()]);
    for (unsigned variantIndex(0); variantIndex<variantCount(); ++variantIndex)
    {
        for (unsigned sampleIndex(0); sampleIndex<sampleCount(); ++sampleIndex)
        {
            const allele_t* call(&(_data[variantIndex][sampleIndex][0]));
            mask[variantIndex][sampleIndex] = predicate(call, ploidy());
        }
    }
    return mask;
}



namespace
{

bool
isMissingCall(const allele_t* call, const unsigned ploidy)
{
    return std::any_of(call, call+ploidy, [](const allele_t a)
    {
        return isMissingAllele(a);
    });
}

bool
isHomRefCall(const allele_t* call, const unsigned ploidy)
{
    return std::all_of(call, call+ploidy, [](const allele_t a)
    {
        return (a == 0);
    });
}

bool
isHetCall(const allele_t* call, const unsigned ploidy)
{
    if (isMissingCall(call, ploidy)) return false;
    return std::any_of(call+1, call+ploidy, [&](const allele_t a)
    {
        return (a != call[0]);
    });
}

bool
isHomAltCall(const allele_t* call, const unsigned ploidy)
{
    if (call[0] <= 0) return false;
    return std::all_of(call+1, call+ploidy, [&](const allele_t a)
    {
        return (a == call[0]);
    });
}

}



CallMask
GenotypeArray::
isMissing() const
{
    return getCallMask(isMissingCall);
}



CallMask
GenotypeArray::
isHomRef() const
{
    return getCallMask(isHomRefCall);
}



CallMask
GenotypeArray::
isHet() const
{
    return getCallMask(isHetCall);
}



CallMask
GenotypeArray::
isHomAlt() const
{
    return getCallMask(isHomAltCall);
}



GenotypeArray
GenotypeArray::
subsetSamples(
    const unsigned beginSampleIndex,
    const unsigned endSampleIndex) const
{
    using namespace trioscan::common;

    if ((beginSampleIndex > endSampleIndex) || (endSampleIndex > sampleCount()))
    {
        std::ostringstream oss;
        oss << "Invalid sample range [" << beginSampleIndex << "," << endSampleIndex
            << ") for genotype array with " << sampleCount() << " samples";
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    GenotypeArray subset(variantCount(), (endSampleIndex-beginSampleIndex), ploidy());
    typedef boost::multi_array_types::index_range range_t;
    subset._data = _data[boost::indices[range_t()][range_t(beginSampleIndex,endSampleIndex)][range_t()]];
    return subset;
}



std::ostream&
operator<<(std::ostream& os, const GenotypeArray& genotypes)
{
    for (unsigned variantIndex(0); variantIndex<genotypes.variantCount(); ++variantIndex)
    {
        for (unsigned sampleIndex(0); sampleIndex<genotypes.sampleCount(); ++sampleIndex)
        {
            if (sampleIndex > 0) os << '\t';
            for (unsigned ploidyIndex(0); ploidyIndex<genotypes.ploidy(); ++ploidyIndex)
            {
                if (ploidyIndex > 0) os << '/';
                const int allele(genotypes.getAllele(variantIndex, sampleIndex, ploidyIndex));
                if (isMissingAllele(allele))
                {
                    os << '.';
                }
                else
                {
                    os << allele;
                }
            }
        }
        os << '\n';
    }
    return os;
}
