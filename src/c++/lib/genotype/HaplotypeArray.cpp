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

#include "genotype/HaplotypeArray.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>



HaplotypeArray::
HaplotypeArray(
    const unsigned variantCount,
    const unsigned haplotypeCount)
    : _data(boost::extents[variantCount][haplotypeCount])
{
    std::fill_n(_data.data(), _data.num_elements(), MISSING_ALLELE);
}



HaplotypeArray::
HaplotypeArray(
    const nested_t& calls)
{
    using namespace trioscan::common;

    const unsigned variantCount(calls.size());
    const unsigned haplotypeCount(calls.empty() ? 0 : calls[0].size());
    _data.resize(boost::extents[variantCount][haplotypeCount]);

    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        const auto& variantCalls(calls[variantIndex]);
        if (variantCalls.size() != haplotypeCount)
        {
            std::ostringstream oss;
            oss << "Inconsistent haplotype count in haplotype array. Variant " << variantIndex
                << " has " << variantCalls.size() << " haplotypes, expected " << haplotypeCount;
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
        }
        for (unsigned haplotypeIndex(0); haplotypeIndex<haplotypeCount; ++haplotypeIndex)
        {
            _data[variantIndex][haplotypeIndex] = convertAllele(variantCalls[haplotypeIndex]);
        }
    }
}



HaplotypeArray&
HaplotypeArray::
operator=(const HaplotypeArray& rhs)
{
    if (this == &rhs) return *this;
    _data.resize(boost::extents[rhs.variantCount()][rhs.haplotypeCount()]);
    _data = rhs._data;
    return *this;
}



int
HaplotypeArray::
maxAllele() const
{
    if (_data.num_elements() == 0) return MISSING_ALLELE;
    const allele_t* begin(_data.data());
    return *std::max_element(begin, begin+_data.num_elements());
}



CallMask
HaplotypeArray::
isMissing() const
{
    CallMask mask(boost::extents[variantCount()][haplotypeCount()]);
    for (unsigned variantIndex(0); variantIndex<variantCount(); ++variantIndex)
    {
        for (unsigned haplotypeIndex(0); haplotypeIndex<haplotypeCount(); ++haplotypeIndex)
        {
            mask[variantIndex][haplotypeIndex] = isMissingAllele(_data[variantIndex][haplotypeIndex]);
        }
    }
    return mask;
}



HaplotypeArray
HaplotypeArray::
subsetHaplotypes(
    const unsigned beginHaplotypeIndex,
    const unsigned endHaplotypeIndex) const
{
    using namespace trioscan::common;

    if ((beginHaplotypeIndex > endHaplotypeIndex) || (endHaplotypeIndex > haplotypeCount()))
    {
        std::ostringstream oss;
        oss << "Invalid haplotype range [" << beginHaplotypeIndex << "," << endHaplotypeIndex
            << ") for haplotype array with " << haplotypeCount() << " haplotypes";
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    HaplotypeArray subset(variantCount(), (endHaplotypeIndex-beginHaplotypeIndex));
    typedef boost::multi_array_types::index_range range_t;
    subset._data = _data[boost::indices[range_t()][range_t(beginHaplotypeIndex,endHaplotypeIndex)]];
    return subset;
}



GenotypeArray
HaplotypeArray::
toDiplotypes(
    const unsigned ploidy) const
{
    using namespace trioscan::common;

    if ((ploidy == 0) || ((haplotypeCount() % ploidy) != 0))
    {
        std::ostringstream oss;
        oss << "Can't group " << haplotypeCount() << " haplotypes into samples of ploidy " << ploidy;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const unsigned sampleCount(haplotypeCount()/ploidy);
    GenotypeArray genotypes(variantCount(), sampleCount, ploidy);
    for (unsigned variantIndex(0); variantIndex<variantCount(); ++variantIndex)
    {
        for (unsigned haplotypeIndex(0); haplotypeIndex<haplotypeCount(); ++haplotypeIndex)
        {
            genotypes.setAllele(variantIndex, (haplotypeIndex/ploidy), (haplotypeIndex%ploidy),
                                _data[variantIndex][haplotypeIndex]);
        }
    }
    return genotypes;
}
