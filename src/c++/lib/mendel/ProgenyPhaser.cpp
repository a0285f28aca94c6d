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

#include "mendel/ProgenyPhaser.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>

//#define DEBUG_PHASER

#ifdef DEBUG_PHASER
#include "blt_util/log.hh"
#endif



static
bool
isMissingCall(const DiploidCall& call)
{
    return (isMissingAllele(call[0]) || isMissingAllele(call[1]));
}



static
bool
isParentAllele(
    const DiploidCall& parent,
    const allele_t allele)
{
    return ((allele == parent[0]) || (allele == parent[1]));
}



bool
phaseProgenyGenotype(
    const DiploidCall& parent1,
    const DiploidCall& parent2,
    DiploidCall& progeny)
{
    if (isMissingCall(parent1) || isMissingCall(parent2) || isMissingCall(progeny)) return false;

    // enumerate the distinct orderings of the progeny alleles:
    const unsigned candidateCount((progeny[0] == progeny[1]) ? 1 : 2);
    const DiploidCall candidates[2] = {{{progeny[0], progeny[1]}}, {{progeny[1], progeny[0]}}};

    unsigned consistentCount(0);
    unsigned consistentIndex(0);
    for (unsigned candidateIndex(0); candidateIndex<candidateCount; ++candidateIndex)
    {
        const DiploidCall& candidate(candidates[candidateIndex]);
        if (isParentAllele(parent1, candidate[0]) && isParentAllele(parent2, candidate[1]))
        {
            consistentCount++;
            consistentIndex = candidateIndex;
        }
    }

    if (consistentCount != 1) return false;
    progeny = candidates[consistentIndex];
    return true;
}



static
DiploidCall
getCall(
    const GenotypeArray& genotypes,
    const unsigned variantIndex,
    const unsigned sampleIndex)
{
    return {{genotypes.getAllele(variantIndex,sampleIndex,0), genotypes.getAllele(variantIndex,sampleIndex,1)}};
}



/// all reads and writes are restricted to genotypes
static
CallMask
phaseProgenyGenotypes(
    GenotypeArray& genotypes)
{
    static const unsigned parentCount(2);

    const unsigned variantCount(genotypes.variantCount());
    const unsigned sampleCount(genotypes.sampleCount());

    CallMask isPhased(boost::extents[variantCount][sampleCount]);
    std::fill_n(isPhased.data(), isPhased.num_elements(), false);

    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        const DiploidCall parent1(getCall(genotypes,variantIndex,0));
        const DiploidCall parent2(getCall(genotypes,variantIndex,1));

        for (unsigned sampleIndex(parentCount); sampleIndex<sampleCount; ++sampleIndex)
        {
            DiploidCall progeny(getCall(genotypes,variantIndex,sampleIndex));
            if (! phaseProgenyGenotype(parent1, parent2, progeny)) continue;

#ifdef DEBUG_PHASER
            log_os << "phased variant/sample: " << variantIndex << "/" << sampleIndex
                   << " p1: " << static_cast<int>(parent1[0]) << "/" << static_cast<int>(parent1[1])
                   << " p2: " << static_cast<int>(parent2[0]) << "/" << static_cast<int>(parent2[1])
                   << " progeny: " << static_cast<int>(progeny[0]) << "|" << static_cast<int>(progeny[1]) << "\n";
#endif

            genotypes.setAllele(variantIndex,sampleIndex,0,progeny[0]);
            genotypes.setAllele(variantIndex,sampleIndex,1,progeny[1]);
            isPhased[variantIndex][sampleIndex] = true;
        }
    }
    return isPhased;
}



ProgenyPhaseResult
phaseProgenyByTransmission(
    GenotypeArray& genotypes,
    const ProgenyPhaserOptions& opt)
{
    using namespace trioscan::common;

    assertDiploid(genotypes);
    if (genotypes.sampleCount() < 3)
    {
        std::ostringstream oss;
        oss << "bad genotypes: at least three samples required (2 parents and 1 or more progeny); found "
            << genotypes.sampleCount();
        BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
    }

    if (opt.isCopy)
    {
        GenotypeArray phasedGenotypes(genotypes);
        const CallMask isPhased(phaseProgenyGenotypes(phasedGenotypes));
        return ProgenyPhaseResult(phasedGenotypes, isPhased);
    }

    const CallMask isPhased(phaseProgenyGenotypes(genotypes));
    return ProgenyPhaseResult(genotypes, isPhased);
}
