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

#include "mendel/mendel_shared.hh"

#include "common/Exceptions.hh"

#include <sstream>



void
assertDiploid(const GenotypeArray& genotypes)
{
    using namespace trioscan::common;

    if (genotypes.ploidy() == 2) return;

    std::ostringstream oss;
    oss << "operation requires diploid data, found ploidy " << genotypes.ploidy();
    BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
}



void
assertMatchingVariantCount(
    const unsigned variantCount1,
    const unsigned variantCount2,
    const char* label)
{
    using namespace trioscan::common;

    if (variantCount1 == variantCount2) return;

    std::ostringstream oss;
    oss << "Mismatched variant count between parent and progeny " << label
        << ": " << variantCount1 << " vs " << variantCount2;
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
}



CallMask
broadcastVariantMask(
    const VariantMask& variantMask,
    const unsigned columnCount)
{
    const unsigned variantCount(variantMask.size());
    CallMask mask(boost::extents[variantCount][columnCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned columnIndex(0); columnIndex<columnCount; ++columnIndex)
        {
            mask[variantIndex][columnIndex] = variantMask[variantIndex];
        }
    }
    return mask;
}



VariantMask
anyOverSamples(const CallMask& mask)
{
    const unsigned variantCount(mask.shape()[0]);
    const unsigned sampleCount(mask.shape()[1]);
    VariantMask result(variantCount, false);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned sampleIndex(0); sampleIndex<sampleCount; ++sampleIndex)
        {
            if (mask[variantIndex][sampleIndex])
            {
                result[variantIndex] = true;
                break;
            }
        }
    }
    return result;
}
