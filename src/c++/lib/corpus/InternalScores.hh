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
/// \brief calibration scores of each document against the rest of its corpus
///

#pragma once

#include "hc_util/CountMatrix.hh"

#include <vector>


/// \brief p-values of row \p rowIndex of \p dtm against (counts - row)
///
/// \p counts must be at least the row counts on every feature, which holds
/// whenever counts are the column sums of a matrix containing the row.
std::vector<double>
getRowPvals(
    const CountMatrix& dtm,
    const CountVector& counts,
    const unsigned rowIndex);


/// \brief HC score of each row of \p dtm against (counts - row)
///
/// Rows before \p firstRow are not scored and do not appear in the result.
/// A matrix with fewer than two rows has no meaningful 'rest of corpus', so
/// the result is empty. Rows are scored in parallel when OpenMP is enabled.
///
/// \param[in] counts column sums of \p dtm
std::vector<double>
computeInternalScores(
    const CountMatrix& dtm,
    const CountVector& counts,
    const bool isStableHc,
    const double alpha,
    const unsigned firstRow = 0);
