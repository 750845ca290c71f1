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

///
/// \file
/// \brief Higher Criticism aggregation of per-feature p-values
///

#pragma once

#include <limits>
#include <vector>


/// default fraction of the sorted p-values searched for the HC maximum
extern const double DEFAULT_HC_ALPHA;


struct HcResult
{
    bool
    isDefined() const
    {
        return (score == score);
    }

    /// HC score, NaN when no p-value could be used
    double score = std::numeric_limits<double>::quiet_NaN();

    /// sorted p-value at the maximizing rank
    double threshold = std::numeric_limits<double>::quiet_NaN();
};


/// \brief Compute the Higher Criticism score of a p-value vector
///
/// NaN entries are uninformative and are excluded, n is the number of
/// remaining p-values. With the p-values sorted ascending as p_(1)..p_(n)
/// and u_i = i/n, HC is the maximum over ranks i in [1,max(floor(alpha*n),1)] of:
///
///   sqrt(n) * (u_i - p_(i)) / sqrt(p_(i) * (1 - p_(i)))
///
/// The classical variant always evaluates the denominator with p_(i) clipped
/// to [1/(n+1), n/(n+1)]. The stable variant clips only where p_(i) is 0 or 1,
/// so any non-empty p-value vector has a defined score. Ties resolve to the
/// lowest rank.
///
/// \param[in] isStable selects the stable variant
/// \param[in] alpha fraction of sorted p-values to search, in (0,1]
HcResult
higherCriticism(
    const std::vector<double>& pvals,
    const bool isStable,
    const double alpha = DEFAULT_HC_ALPHA);


/// \return indices of all p-values strictly below threshold, NaN p-values are never included
std::vector<unsigned>
getSignificantFeatureIndices(
    const std::vector<double>& pvals,
    const double threshold);
