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
/// \brief allele coding shared by the genotype and haplotype containers
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/multi_array.hpp"

#include "blt_util/thirdparty_pop.h"

#include <cstdint>


typedef int8_t allele_t;

/// any negative allele code is treated as missing, this is the value
/// stored by the containers:
static const allele_t MISSING_ALLELE(-1);

/// per-call allele counts, indexed (variant, sample, allele)
typedef boost::multi_array<int8_t,3> AlleleCountArray;

/// per-call boolean predicate, indexed (variant, sample)
typedef boost::multi_array<bool,2> CallMask;


inline
bool
isMissingAllele(const int allele)
{
    return (allele < 0);
}

/// convert a client supplied allele code to the stored representation
///
/// negative codes are normalized to MISSING_ALLELE, codes which can't be
/// represented throw InvalidParameterException
allele_t
convertAllele(const int allele);
