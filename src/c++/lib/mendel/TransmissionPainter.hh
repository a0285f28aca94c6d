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
/// \brief paint haplotypes inherited from a single diploid parent
///

#pragma once

#include "mendel/mendel_shared.hh"
#include "genotype/HaplotypeArray.hh"


namespace INHERITANCE_STATE
{
/// states are listed in the order they are applied, when several
/// conditions hold for one call the last one wins
enum index_t
{
    UNDETERMINED,
    PARENT1,
    PARENT2,
    NONSEG_REF,
    NONSEG_ALT,
    NONPARENTAL,
    PARENT_MISSING,
    MISSING,
    SIZE
};

inline
const char*
getLabel(const unsigned i)
{
    switch (static_cast<index_t>(i))
    {
    case UNDETERMINED:
        return "UNDETERMINED";
    case PARENT1:
        return "PARENT1";
    case PARENT2:
        return "PARENT2";
    case NONSEG_REF:
        return "NONSEG_REF";
    case NONSEG_ALT:
        return "NONSEG_ALT";
    case NONPARENTAL:
        return "NONPARENTAL";
    case PARENT_MISSING:
        return "PARENT_MISSING";
    case MISSING:
        return "MISSING";
    default:
        return "UNKNOWN";
    }
}
}


/// paint progeny haplotypes according to their allelic inheritance from
/// one diploid parent
///
/// \param[in] parentHaplotypes both haplotypes of the parent, shape (variants, 2)
/// \param[in] progenyHaplotypes haplotypes inherited from this parent by
///            each progeny, ie. from the parent's gametes, shape (variants, progeny)
///
/// \return INHERITANCE_STATE code for each progeny haplotype, shape (variants, progeny)
///
PaintingArray
paintTransmission(
    const HaplotypeArray& parentHaplotypes,
    const HaplotypeArray& progenyHaplotypes);
