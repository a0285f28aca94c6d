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

#include "genotype/allele_util.hh"

#include "common/Exceptions.hh"

#include <limits>
#include <sstream>


allele_t
convertAllele(const int allele)
{
    using namespace trioscan::common;

    if (isMissingAllele(allele)) return MISSING_ALLELE;

    static const int maxAllele(std::numeric_limits<allele_t>::max());
    if (allele > maxAllele)
    {
        std::ostringstream oss;
        oss << "Allele code " << allele << " exceeds the maximum supported allele code " << maxAllele;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }
    return static_cast<allele_t>(allele);
}
