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
/// \brief dense haplotype call container
///

#pragma once

#include "genotype/GenotypeArray.hh"

#include <vector>


/// haplotype calls indexed (variant, haplotype)
///
struct HaplotypeArray
{
    typedef boost::multi_array<allele_t,2> data_t;

    /// nested client representation, indexed [variant][haplotype]
    typedef std::vector<std::vector<int>> nested_t;

    /// create an array with all calls missing
    HaplotypeArray(
        const unsigned variantCount,
        const unsigned haplotypeCount);

    explicit
    HaplotypeArray(
        const nested_t& calls);

    HaplotypeArray(const HaplotypeArray& rhs) = default;

    HaplotypeArray&
    operator=(const HaplotypeArray& rhs);

    unsigned
    variantCount() const
    {
        return _data.shape()[0];
    }

    unsigned
    haplotypeCount() const
    {
        return _data.shape()[1];
    }

    allele_t
    getAllele(
        const unsigned variantIndex,
        const unsigned haplotypeIndex) const
    {
        return _data[variantIndex][haplotypeIndex];
    }

    void
    setAllele(
        const unsigned variantIndex,
        const unsigned haplotypeIndex,
        const int allele)
    {
        _data[variantIndex][haplotypeIndex] = convertAllele(allele);
    }

    int
    maxAllele() const;

    CallMask
    isMissing() const;

    /// copy of haplotypes in [beginHaplotypeIndex,endHaplotypeIndex)
    HaplotypeArray
    subsetHaplotypes(
        const unsigned beginHaplotypeIndex,
        const unsigned endHaplotypeIndex) const;

    /// group each run of ploidy adjacent haplotypes into one sample
    GenotypeArray
    toDiplotypes(
        const unsigned ploidy = 2) const;

private:
    data_t _data;
};
