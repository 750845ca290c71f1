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

#include "stats/HigherCriticism.hh"

#include <algorithm>
#include <cassert>
#include <cmath>


const double DEFAULT_HC_ALPHA(0.45);



HcResult
higherCriticism(
    const std::vector<double>& pvals,
    const bool isStable,
    const double alpha)
{
    assert((alpha > 0.) && (alpha <= 1.));

    std::vector<double> sorted;
    sorted.reserve(pvals.size());
    for (const double pval : pvals)
    {
        if (std::isnan(pval)) continue;
        sorted.push_back(pval);
    }

    HcResult result;
    const unsigned n(sorted.size());
    if (n == 0) return result;

    std::sort(sorted.begin(), sorted.end());

    const double nf(n);
    const double sqrtN(std::sqrt(nf));
    const unsigned maxRank(std::min(std::max(static_cast<unsigned>(std::floor(alpha*nf)),1u),n));

    // denominators are clipped to p in [1/(n+1), n/(n+1)], always for the classical
    // variant and only where p(1-p) vanishes for the stable variant:
    const double minClipPval(1./(nf+1.));
    const double maxClipPval(nf/(nf+1.));

    for (unsigned rank(1); rank<=maxRank; ++rank)
    {
        const double pval(sorted[rank-1]);
        const double u(rank/nf);
        double var(pval*(1.-pval));
        if ((! isStable) || (var <= 0.))
        {
            const double clipPval(std::min(std::max(pval,minClipPval),maxClipPval));
            var = clipPval*(1.-clipPval);
        }

        const double z(sqrtN*(u-pval)/std::sqrt(var));
        if ((! result.isDefined()) || (z > result.score))
        {
            result.score = z;
            result.threshold = pval;
        }
    }
    return result;
}



std::vector<unsigned>
getSignificantFeatureIndices(
    const std::vector<double>& pvals,
    const double threshold)
{
    std::vector<unsigned> indices;
    const unsigned pvalCount(pvals.size());
    for (unsigned featureIndex(0); featureIndex<pvalCount; ++featureIndex)
    {
        // NaN comparison is false, so masked features are excluded:
        if (pvals[featureIndex] < threshold) indices.push_back(featureIndex);
    }
    return indices;
}
