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
/// \brief per-table Higher Criticism configuration
///

#pragma once

#include "stats/HigherCriticism.hh"


struct HcOptions
{
    /// fraction of the sorted p-values searched for the HC maximum
    double alpha = DEFAULT_HC_ALPHA;

    /// selects the stable HC variant, see higherCriticism()
    bool isStableHc = true;

    /// if true, rank evaluation writes its warnings to log_os
    bool isLogNotices = true;
};
