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
/// \brief array types and mask utilities shared by the transmission analyses
///

#pragma once

#include "genotype/GenotypeArray.hh"

#include <cstdint>
#include <vector>


/// count of Mendel errors, indexed (variant, progeny)
typedef boost::multi_array<uint8_t,2> MendelErrorArray;

/// inheritance state codes, indexed (variant, progeny haplotype)
typedef boost::multi_array<uint8_t,2> PaintingArray;

/// per-variant boolean predicate
typedef std::vector<bool> VariantMask;


/// throw PreConditionException unless genotypes are diploid
void
assertDiploid(const GenotypeArray& genotypes);

/// throw InvalidParameterException unless both inputs cover the same variants
void
assertMatchingVariantCount(
    const unsigned variantCount1,
    const unsigned variantCount2,
    const char* label);

/// expand a per-variant mask across columnCount columns
CallMask
broadcastVariantMask(
    const VariantMask& variantMask,
    const unsigned columnCount);

/// true for each variant where any sample in the call mask is true
VariantMask
anyOverSamples(const CallMask& mask);

/// set result to value wherever mask is true
///
/// masks are applied one after the other, so the caller controls
/// precedence through the order of calls
///
template <typename T>
void
setMasked(
    boost::multi_array<T,2>& result,
    const CallMask& mask,
    const typename boost::multi_array<T,2>::element value)
{
    const unsigned rowCount(result.shape()[0]);
    const unsigned columnCount(result.shape()[1]);
    for (unsigned rowIndex(0); rowIndex<rowCount; ++rowIndex)
    {
        for (unsigned columnIndex(0); columnIndex<columnCount; ++columnIndex)
        {
            if (mask[rowIndex][columnIndex]) result[rowIndex][columnIndex] = value;
        }
    }
}
