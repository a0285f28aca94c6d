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
/// \brief dense genotype call container
///

#pragma once

#include "genotype/allele_util.hh"

#include <iosfwd>
#include <vector>


/// genotype calls indexed (variant, sample, ploidy)
///
/// a call is missing when any of its alleles is missing
///
struct GenotypeArray
{
    typedef boost::multi_array<allele_t,3> data_t;

    /// nested client representation, indexed [variant][sample][ploidy]
    typedef std::vector<std::vector<std::vector<int>>> nested_t;

    /// create an array with all calls missing
    GenotypeArray(
        const unsigned variantCount,
        const unsigned sampleCount,
        const unsigned ploidy = 2);

    /// \param[in] calls all samples must have the same number of
    ///            alleles, and all variants the same number of samples
    explicit
    GenotypeArray(
        const nested_t& calls);

    GenotypeArray(const GenotypeArray& rhs) = default;

    GenotypeArray&
    operator=(const GenotypeArray& rhs);

    bool
    operator==(const GenotypeArray& rhs) const
    {
        return (_data == rhs._data);
    }

    bool
    operator!=(const GenotypeArray& rhs) const
    {
        return (! (*this == rhs));
    }

    unsigned
    variantCount() const
    {
        return _data.shape()[0];
    }

    unsigned
    sampleCount() const
    {
        return _data.shape()[1];
    }

    unsigned
    ploidy() const
    {
        return _data.shape()[2];
    }

    allele_t
    getAllele(
        const unsigned variantIndex,
        const unsigned sampleIndex,
        const unsigned ploidyIndex) const
    {
        return _data[variantIndex][sampleIndex][ploidyIndex];
    }

    void
    setAllele(
        const unsigned variantIndex,
        const unsigned sampleIndex,
        const unsigned ploidyIndex,
        const int allele)
    {
        _data[variantIndex][sampleIndex][ploidyIndex] = convertAllele(allele);
    }

    bool
    isCallMissing(
        const unsigned variantIndex,
        const unsigned sampleIndex) const;

    /// highest allele code in the array, or MISSING_ALLELE if every call
    /// is missing
    int
    maxAllele() const;

    /// count each allele in [0,maxAllele] for every call
    ///
    /// missing alleles are not counted, so the allele dimension is empty
    /// when maxAllele is negative
    AlleleCountArray
    toAlleleCounts(
        const int maxAllele) const;

    CallMask
    isMissing() const;

    /// all alleles are the reference allele
    CallMask
    isHomRef() const;

    /// non-missing call with at least two distinct alleles
    CallMask
    isHet() const;

    /// non-missing call with a single non-reference allele
    CallMask
    isHomAlt() const;

    /// copy of samples in [beginSampleIndex,endSampleIndex)
    GenotypeArray
    subsetSamples(
        const unsigned beginSampleIndex,
        const unsigned endSampleIndex) const;

    const data_t&
    data() const
    {
        return _data;
    }

private:
    typedef bool (*call_predicate_t)(const allele_t*, const unsigned);

    CallMask
    getCallMask(call_predicate_t predicate) const;

    data_t _data;
};


std::ostream&
operator<<(std::ostream& os, const GenotypeArray& genotypes);
