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

#include "corpus/InternalScores.hh"

#include "stats/HigherCriticism.hh"
#include "stats/PairwiseCountTest.hh"

#include <cassert>



std::vector<double>
getRowPvals(
    const CountMatrix& dtm,
    const CountVector& counts,
    const unsigned rowIndex)
{
    assert(counts.size() == dtm.colCount());

    CountVector row(dtm.getRow(rowIndex));
    CountVector rest(counts);
    for (const auto& entry : dtm.getSparseRow(rowIndex))
    {
        assert(rest[entry.first] >= entry.second);
        rest[entry.first] -= entry.second;
    }
    return twoCountsPvals(row,rest);
}



std::vector<double>
computeInternalScores(
    const CountMatrix& dtm,
    const CountVector& counts,
    const bool isStableHc,
    const double alpha,
    const unsigned firstRow)
{
    const unsigned rowCount(dtm.rowCount());
    if ((rowCount < 2) || (firstRow >= rowCount)) return std::vector<double>();

    const int scoreCount(rowCount-firstRow);
    std::vector<double> scores(scoreCount);

    #pragma omp parallel for schedule(dynamic)
    for (int scoreIndex = 0; scoreIndex < scoreCount; ++scoreIndex)
    {
        const std::vector<double> pvals(getRowPvals(dtm,counts,firstRow+scoreIndex));
        scores[scoreIndex] = higherCriticism(pvals,isStableHc,alpha).score;
    }
    return scores;
}
