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
/// \brief locate genotype calls inconsistent with Mendelian transmission
///

#pragma once

#include "mendel/mendel_shared.hh"


/// count the alleles in each progeny call which can't be explained by
/// Mendelian transmission from the two parents
///
/// Counts are 1 or 2 for non-parental and hemi-parental calls, depending
/// on how many progeny alleles are unavailable from the parents. A progeny
/// call identical to either parent is counted as a single (uni-parental)
/// error at variants where the parents share no allele. Calls are never
/// counted as errors where either parent call is missing.
///
/// \param[in] parentGenotypes diploid calls for exactly two parents,
///            shape (variants, 2, 2)
/// \param[in] progenyGenotypes diploid calls for the progeny, shape
///            (variants, progeny, 2)
///
/// \return error counts, shape (variants, progeny)
///
MendelErrorArray
getMendelErrors(
    const GenotypeArray& parentGenotypes,
    const GenotypeArray& progenyGenotypes);
