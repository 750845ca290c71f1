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
/// \brief HC score and empirical rank of a candidate against a corpus table
///

#pragma once

#include "corpus/CorpusTable.hh"

#include "boost/optional.hpp"

#include <limits>
#include <string>
#include <vector>


enum class RANK_MODE
{
    /// rank against the table's cached internal scores
    INTERNAL,
    /// rank against internal scores recomputed with the candidate added to the table
    LEAVE_ONE_OUT
};


struct RankQuery
{
    RANK_MODE mode = RANK_MODE::INTERNAL;

    /// candidate counts are already included in the table counts
    bool isWithin = false;

    /// features excluded from the HC computation
    std::vector<std::string> maskedFeatures;

    /// HC variant, the table's variant is used if unset
    boost::optional<bool> isStableHc;

    /// HC search fraction, the table's value is used if unset
    boost::optional<double> alpha;
};


struct RankResult
{
    double hc = std::numeric_limits<double>::quiet_NaN();
    double threshold = std::numeric_limits<double>::quiet_NaN();

    /// empirical rank in [0,1], NaN if undefined
    double rank = std::numeric_limits<double>::quiet_NaN();

    /// features with a p-value below threshold, in vocabulary order
    std::vector<std::string> significantFeatures;

    /// non-fatal conditions which may affect the meaning of the result
    std::vector<std::string> warnings;
};


/// \brief fraction of the calibration scores below \p hc
///
/// rank = (#{scores < hc} + isWithin) / (#scores + 1 - isWithin)
///
/// \return rank, NaN if \p scores is empty or \p hc is NaN
double
computeEmpiricalRank(
    const std::vector<double>& scores,
    const double hc,
    const bool isWithin);


/// \brief Evaluates the HC score of candidate counts relative to a corpus table
///
/// INTERNAL mode compares the candidate score to the table's cached internal
/// scores, which costs one pass over the features. LEAVE_ONE_OUT mode adds the
/// candidate to the table as an extra document and rescores every table
/// document against the extended table, which costs one pass over the
/// features per document but removes the bias of calibrating against counts
/// which exclude the candidate.
///
/// The evaluator references the table, which must outlive it.
///
class RankEvaluator
{
public:
    explicit
    RankEvaluator(
        const CorpusTable& table)
        : _table(table)
    {}

    /// \param[in] candidateCounts counts in the table's vocabulary order
    RankResult
    evaluate(
        const CountVector& candidateCounts,
        const RankQuery& query = RankQuery()) const;

    /// evaluate the total counts of \p candidate, realigning its vocabulary if required
    RankResult
    evaluate(
        const CorpusTable& candidate,
        const RankQuery& query = RankQuery()) const;

private:
    void
    evaluateCounts(
        const CountVector& candidateCounts,
        const RankQuery& query,
        RankResult& result) const;

    const CorpusTable& _table;
};
