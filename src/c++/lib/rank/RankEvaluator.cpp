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

#include "rank/RankEvaluator.hh"

#include "common/Exceptions.hh"
#include "corpus/InternalScores.hh"
#include "hc_util/log.hh"
#include "options/HcOptionsValidate.hh"

#include <algorithm>
#include <cmath>
#include <sstream>



double
computeEmpiricalRank(
    const std::vector<double>& scores,
    const double hc,
    const bool isWithin)
{
    if (scores.empty() || std::isnan(hc)) return std::numeric_limits<double>::quiet_NaN();

    const unsigned lessCount(std::count_if(scores.begin(), scores.end(),
                                           [&](const double score)
    {
        return (score < hc);
    }));
    const unsigned withinCount(isWithin ? 1 : 0);

    const double rank(static_cast<double>(lessCount+withinCount)/
                      static_cast<double>(scores.size()+1-withinCount));
    return std::min(rank,1.);
}



RankResult
RankEvaluator::
evaluate(
    const CountVector& candidateCounts,
    const RankQuery& query) const
{
    RankResult result;
    evaluateCounts(candidateCounts,query,result);
    return result;
}



RankResult
RankEvaluator::
evaluate(
    const CorpusTable& candidate,
    const RankQuery& query) const
{
    RankResult result;
    const CorpusTable aligned(_table.getAlignedTable(candidate,result.warnings));
    evaluateCounts(aligned.getCounts(),query,result);
    return result;
}



void
RankEvaluator::
evaluateCounts(
    const CountVector& candidateCounts,
    const RankQuery& query,
    RankResult& result) const
{
    const HcOptions& tableOpt(_table.getOptions());

    HcOptions queryOpt(tableOpt);
    if (query.isStableHc) queryOpt.isStableHc = *query.isStableHc;
    if (query.alpha) queryOpt.alpha = *query.alpha;
    validateHcOptions(queryOpt);

    std::vector<double> pvals(_table.getPvals(candidateCounts,query.isWithin));

    for (const auto& feature : query.maskedFeatures)
    {
        unsigned featureIndex(0);
        if (! _table.getFeatureIndex(feature,featureIndex)) continue;
        pvals[featureIndex] = std::numeric_limits<double>::quiet_NaN();
    }

    const HcResult hc(higherCriticism(pvals,queryOpt.isStableHc,queryOpt.alpha));
    result.hc = hc.score;
    result.threshold = hc.threshold;
    if (! hc.isDefined())
    {
        result.warnings.push_back("HC score is undefined because no feature has a usable p-value. Rank is undefined.");
    }

    const auto& featureNames(_table.getFeatureNames());
    for (const unsigned featureIndex : getSignificantFeatureIndices(pvals,hc.threshold))
    {
        result.significantFeatures.push_back(featureNames[featureIndex]);
    }

    if ((query.mode == RANK_MODE::INTERNAL) || query.isWithin)
    {
        if (query.mode == RANK_MODE::LEAVE_ONE_OUT)
        {
            result.warnings.push_back("Leave-one-out evaluation of a 'within' candidate uses the table internal scores, "
                                      "which already score the candidate against the rest of the table.");
        }

        if ((queryOpt.isStableHc != tableOpt.isStableHc) || (queryOpt.alpha != tableOpt.alpha))
        {
            std::ostringstream oss;
            oss << "HC type (isStableHc: " << queryOpt.isStableHc << ", alpha: " << queryOpt.alpha
                << ") does not match the internal HC type of the table (isStableHc: " << tableOpt.isStableHc
                << ", alpha: " << tableOpt.alpha << "). Rank may be meaningless.";
            result.warnings.push_back(oss.str());
        }

        const std::vector<double>& scores(_table.getInternalScores());
        if (scores.empty())
        {
            result.warnings.push_back("Table has a single document so internal scores are undefined. Rank is undefined.");
        }
        result.rank = computeEmpiricalRank(scores,hc.score,query.isWithin);
    }
    else
    {
        // the candidate is the first document of the extended table:
        const CountMatrix& dtm(_table.getMatrix());
        CountMatrix merged(dtm.colCount());
        merged.addRow(candidateCounts);
        merged.vstack(dtm);

        CountVector mergedCounts(_table.getCounts());
        const unsigned featureCount(mergedCounts.size());
        for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
        {
            mergedCounts[featureIndex] += candidateCounts[featureIndex];
        }

        const std::vector<double> looScores(
            computeInternalScores(merged,mergedCounts,queryOpt.isStableHc,queryOpt.alpha,1));
        if (looScores.empty())
        {
            using namespace hcrank::common;
            BOOST_THROW_EXCEPTION(InvalidInputException(
                                      "Leave-one-out comparison population is empty, there are no documents to rank against"));
        }
        result.rank = computeEmpiricalRank(looScores,hc.score,query.isWithin);
    }

    if (tableOpt.isLogNotices) logNotices(result.warnings);
}
