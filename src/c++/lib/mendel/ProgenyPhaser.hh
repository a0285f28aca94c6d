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
/// \brief phase progeny genotypes by Mendelian transmission
///

#pragma once

#include "mendel/mendel_shared.hh"

#include <array>


struct ProgenyPhaserOptions
{
    /// phase an independent copy of the input genotypes, leaving the
    /// caller's array untouched, otherwise phase in place
    bool isCopy = false;
};


struct ProgenyPhaseResult
{
    ProgenyPhaseResult(
        const GenotypeArray& initGenotypes,
        const CallMask& initIsPhased)
        : genotypes(initGenotypes),
          isPhased(initIsPhased)
    {}

    /// genotypes with each phased progeny call ordered as
    /// (allele from parent 1, allele from parent 2)
    GenotypeArray genotypes;

    /// true where a progeny call has been phased, parents are always false
    CallMask isPhased;
};


typedef std::array<allele_t,2> DiploidCall;


/// phase a single progeny call given both parent calls
///
/// The call is phased when exactly one distinct ordering of its alleles
/// takes the first allele from parent1 and the second from parent2. Calls
/// are left unphased when any of the three calls has a missing allele.
///
/// \param[in,out] progeny reordered to (parent1 allele, parent2 allele)
///                when phased, unchanged otherwise
///
/// \return true if the call is phased
///
bool
phaseProgenyGenotype(
    const DiploidCall& parent1,
    const DiploidCall& parent2,
    DiploidCall& progeny);


/// phase progeny genotypes where possible using Mendelian transmission
///
/// \param[in,out] genotypes diploid calls with the two parents as the
///                first two samples followed by one or more progeny.
///                Phased in place unless opt.isCopy is set.
///
ProgenyPhaseResult
phaseProgenyByTransmission(
    GenotypeArray& genotypes,
    const ProgenyPhaserOptions& opt = ProgenyPhaserOptions());
