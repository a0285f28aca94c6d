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

#include "mendel/MendelSummary.hh"

#include "common/Exceptions.hh"

#include <iostream>
#include <sstream>



static
void
assertIndex(
    const unsigned index,
    const unsigned size,
    const char* label)
{
    using namespace trioscan::common;

    if (index < size) return;

    std::ostringstream oss;
    oss << "Invalid " << label << " index " << index << ", summary contains " << size;
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
}



MendelErrorSummary::
MendelErrorSummary(
    const MendelErrorArray& errors)
    : _progenyErrorCount(errors.shape()[1],0),
      _variantErrorCount(errors.shape()[0],0),
      _totalErrorCount(0),
      _errorVariantCount(0)
{
    const unsigned variantCount(errors.shape()[0]);
    const unsigned progenyCount(errors.shape()[1]);
    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            const unsigned count(errors[variantIndex][progenyIndex]);
            _progenyErrorCount[progenyIndex] += count;
            _variantErrorCount[variantIndex] += count;
            _totalErrorCount += count;
        }
        if (_variantErrorCount[variantIndex] > 0) _errorVariantCount++;
    }
}



unsigned
MendelErrorSummary::
getProgenyErrorCount(const unsigned progenyIndex) const
{
    assertIndex(progenyIndex, progenyCount(), "progeny");
    return _progenyErrorCount[progenyIndex];
}



unsigned
MendelErrorSummary::
getVariantErrorCount(const unsigned variantIndex) const
{
    assertIndex(variantIndex, variantCount(), "variant");
    return _variantErrorCount[variantIndex];
}



void
MendelErrorSummary::
report(std::ostream& os) const
{
    os << "#progenyIndex\tmendelErrors\n";
    for (unsigned progenyIndex(0); progenyIndex<progenyCount(); ++progenyIndex)
    {
        os << progenyIndex << '\t' << _progenyErrorCount[progenyIndex] << '\n';
    }
    os << "#totalErrors\t" << _totalErrorCount << '\n';
    os << "#errorVariants\t" << _errorVariantCount << '\t' << variantCount() << '\n';
}



TransmissionPaintingSummary::
TransmissionPaintingSummary(
    const PaintingArray& painting)
{
    using namespace trioscan::common;

    const unsigned variantCount(painting.shape()[0]);
    const unsigned progenyCount(painting.shape()[1]);

    stateCount_t emptyCount;
    emptyCount.fill(0);
    _stateCount.resize(progenyCount, emptyCount);

    for (unsigned variantIndex(0); variantIndex<variantCount; ++variantIndex)
    {
        for (unsigned progenyIndex(0); progenyIndex<progenyCount; ++progenyIndex)
        {
            const unsigned state(painting[variantIndex][progenyIndex]);
            if (state >= INHERITANCE_STATE::SIZE)
            {
                std::ostringstream oss;
                oss << "Unknown inheritance state " << state << " at variant " << variantIndex
                    << " progeny " << progenyIndex;
                BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
            }
            _stateCount[progenyIndex][state]++;
        }
    }
}



unsigned
TransmissionPaintingSummary::
getStateCount(
    const unsigned progenyIndex,
    const INHERITANCE_STATE::index_t state) const
{
    assertIndex(progenyIndex, progenyCount(), "progeny");
    assertIndex(state, INHERITANCE_STATE::SIZE, "inheritance state");
    return _stateCount[progenyIndex][state];
}



void
TransmissionPaintingSummary::
report(std::ostream& os) const
{
    os << "#progenyIndex";
    for (unsigned stateIndex(0); stateIndex<INHERITANCE_STATE::SIZE; ++stateIndex)
    {
        os << '\t' << INHERITANCE_STATE::getLabel(stateIndex);
    }
    os << '\n';

    for (unsigned progenyIndex(0); progenyIndex<progenyCount(); ++progenyIndex)
    {
        os << progenyIndex;
        for (const unsigned count : _stateCount[progenyIndex])
        {
            os << '\t' << count;
        }
        os << '\n';
    }
}
