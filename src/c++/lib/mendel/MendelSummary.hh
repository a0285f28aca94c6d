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
/// \brief reduce Mendel error and transmission painting arrays to per-sample tallies
///

#pragma once

#include "mendel/TransmissionPainter.hh"

#include <array>
#include <iosfwd>
#include <vector>


/// Mendel error totals per progeny and per variant
struct MendelErrorSummary
{
    explicit
    MendelErrorSummary(
        const MendelErrorArray& errors);

    unsigned
    variantCount() const
    {
        return _variantErrorCount.size();
    }

    unsigned
    progenyCount() const
    {
        return _progenyErrorCount.size();
    }

    unsigned
    getProgenyErrorCount(const unsigned progenyIndex) const;

    unsigned
    getVariantErrorCount(const unsigned variantIndex) const;

    unsigned
    getTotalErrorCount() const
    {
        return _totalErrorCount;
    }

    /// number of variants with at least one error in any progeny
    unsigned
    getErrorVariantCount() const
    {
        return _errorVariantCount;
    }

    /// write tab-delimited per-progeny totals
    void
    report(std::ostream& os) const;

private:
    std::vector<unsigned> _progenyErrorCount;
    std::vector<unsigned> _variantErrorCount;
    unsigned _totalErrorCount;
    unsigned _errorVariantCount;
};



/// count of each inheritance state per progeny haplotype
struct TransmissionPaintingSummary
{
    explicit
    TransmissionPaintingSummary(
        const PaintingArray& painting);

    unsigned
    progenyCount() const
    {
        return _stateCount.size();
    }

    unsigned
    getStateCount(
        const unsigned progenyIndex,
        const INHERITANCE_STATE::index_t state) const;

    /// write a header line of state labels, then tab-delimited state
    /// counts for each progeny haplotype
    void
    report(std::ostream& os) const;

private:
    typedef std::array<unsigned,INHERITANCE_STATE::SIZE> stateCount_t;
    std::vector<stateCount_t> _stateCount;
};
