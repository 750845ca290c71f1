//
// hcrank - Higher Criticism Corpus Ranking
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

#include "options/HcOptionsValidate.hh"

#include "common/Exceptions.hh"

#include <iomanip>
#include <limits>
#include <sstream>



void
check_option_arg_range(
    const double val,
    const char* label,
    const double min,
    const double max,
    std::string& errorMsg)
{
    errorMsg.clear();
    if ((val >= min) && (val <= max)) return;

    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "Value provided for '" << label << "': '" << val
        << "', is not in expected range: [ " << min << " , " << max << " ]";
    errorMsg = oss.str();
}



void
validateHcOptions(
    const HcOptions& opt)
{
    // alpha must be strictly positive so that at least one rank is searched:
    static const double minAlpha(std::numeric_limits<double>::min());

    std::string errorMsg;
    check_option_arg_range(opt.alpha,"alpha",minAlpha,1.,errorMsg);
    if (errorMsg.empty()) return;

    using namespace hcrank::common;
    BOOST_THROW_EXCEPTION(InvalidParameterException(errorMsg));
}
