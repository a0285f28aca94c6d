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

#include "mendel/TransmissionPainter.hh"

#include "common/Exceptions.hh"

#include <algorithm>



namespace
{

/// per-call comparisons of one progeny haplotype set against its parent
struct TransmissionMasks
{
    TransmissionMasks(
        const unsigned variantCount,
        const unsigned progenyCount)
        : isParent1Allele(boost::extents[variantCount][progenyCount]),
          isParent2Allele(boost::extents[variantCount][progenyCount]),
          isCallable(boost::extents[variantCount][progenyCount])
    {}

    CallMask isParent1Allele;
    CallMask isParent2Allele;
    CallMask isCallable;
};



TransmissionMasks
getTransmissionMasks(
    const HaplotypeArray& parentHaplotypes,
    const HaplotypeArray& progenyHaplotypes,
    const VariantMask& isParentMissing)
{
    const unsigned variantCount(progenyHaplotypes.variantCount());
    const unsigned progenyCount(progenyHaplotypes.haplotypeCount());

    TransmissionMasks masks(variantCount, progenyCount);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        const allele_t parent1(parentHaplotypes.getAllele(variantIndex,0));
        const allele_t parent2(parentHaplotypes.getAllele(variantIndex,1));
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            const allele_t progeny(progenyHaplotypes.getAllele(variantIndex,progenyIndex));
            masks.isParent1Allele[variantIndex][progenyIndex] = (progeny == parent1);
            masks.isParent2Allele[variantIndex][progenyIndex] = (progeny == parent2);
            masks.isCallable[variantIndex][progenyIndex] =
                ((! isMissingAllele(progeny)) && (! isParentMissing[variantIndex]));
        }
    }
    return masks;
}



/// combine a call mask with a per-variant parent condition and a per-call
/// allele condition
CallMask
getStateMask(
    const CallMask& isCallable,
    const CallMask& parentCondition,
    const CallMask& alleleCondition)
{
    const unsigned variantCount(isCallable.shape()[0]);
    const unsigned progenyCount(isCallable.shape()[1]);
    CallMask mask(boost::extents[variantCount][progenyCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            mask[variantIndex][progenyIndex] =
                (isCallable[variantIndex][progenyIndex] &&
                 parentCondition[variantIndex][0] &&
                 alleleCondition[variantIndex][progenyIndex]);
        }
    }
    return mask;
}



CallMask
getNonparentalMask(
    const TransmissionMasks& masks)
{
    const unsigned variantCount(masks.isCallable.shape()[0]);
    const unsigned progenyCount(masks.isCallable.shape()[1]);
    CallMask mask(boost::extents[variantCount][progenyCount]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            mask[variantIndex][progenyIndex] =
                (masks.isCallable[variantIndex][progenyIndex] &&
                 (! masks.isParent1Allele[variantIndex][progenyIndex]) &&
                 (! masks.isParent2Allele[variantIndex][progenyIndex]));
        }
    }
    return mask;
}

}



PaintingArray
paintTransmission(
    const HaplotypeArray& parentHaplotypes,
    const HaplotypeArray& progenyHaplotypes)
{
    using namespace trioscan::common;

    if (parentHaplotypes.haplotypeCount() != 2)
    {
        BOOST_THROW_EXCEPTION(PreConditionException("exactly two parental haplotypes should be provided"));
    }
    assertMatchingVariantCount(parentHaplotypes.variantCount(), progenyHaplotypes.variantCount(), "haplotypes");

    const unsigned variantCount(progenyHaplotypes.variantCount());
    const unsigned progenyCount(progenyHaplotypes.haplotypeCount());

    const CallMask isProgenyMissing(progenyHaplotypes.isMissing());
    const VariantMask isParentMissing(anyOverSamples(parentHaplotypes.isMissing()));

    // view the parent as a single diploid sample, shape (variants, 1, 2)
    const GenotypeArray parentDiplotype(parentHaplotypes.toDiplotypes());
    const CallMask isParentHomRef(parentDiplotype.isHomRef());
    const CallMask isParentHet(parentDiplotype.isHet());
    const CallMask isParentHomAlt(parentDiplotype.isHomAlt());

    const TransmissionMasks masks(getTransmissionMasks(parentHaplotypes, progenyHaplotypes, isParentMissing));

    using namespace INHERITANCE_STATE;

    // N.B., order in which these are set matters
    PaintingArray painting(boost::extents[variantCount][progenyCount]);
    std::fill_n(painting.data(), painting.num_elements(), UNDETERMINED);
    setMasked(painting, getStateMask(masks.isCallable, isParentHet, masks.isParent1Allele), PARENT1);
    setMasked(painting, getStateMask(masks.isCallable, isParentHet, masks.isParent2Allele), PARENT2);
    setMasked(painting, getStateMask(masks.isCallable, isParentHomRef, masks.isParent1Allele), NONSEG_REF);
    setMasked(painting, getStateMask(masks.isCallable, isParentHomAlt, masks.isParent1Allele), NONSEG_ALT);
    setMasked(painting, getNonparentalMask(masks), NONPARENTAL);
    setMasked(painting, broadcastVariantMask(isParentMissing, progenyCount), PARENT_MISSING);
    setMasked(painting, isProgenyMissing, MISSING);

    return painting;
}
