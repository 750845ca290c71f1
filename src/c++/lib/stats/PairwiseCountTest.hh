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
/// \brief per-feature two-sample tests of count proportions
///

#pragma once

#include "hc_util/CountMatrix.hh"

#include <vector>


/// \brief two-sided exact binomial test
///
/// Returns the probability under Binomial(nTrials,p) of an outcome deviating
/// from the expectation nTrials*p by at least as much as nSuccess does. The
/// two tails are bounded by mirroring the observed deviation around the
/// expectation.
///
/// \return p-value in [0,1], 1 if nTrials is zero
double
binomialTwoSidedPval(
    const count_t nSuccess,
    const count_t nTrials,
    const double p);


/// \brief test each feature for a difference in proportions between two count samples
///
/// For feature i, the n_i = counts1[i] + counts2[i] occurrences of the feature
/// are split between the two samples. Under the null hypothesis the split follows
/// the proportion of sample 1 among all other features:
///
///   q_i = (T1 - counts1[i]) / (T1 + T2 - n_i)
///
/// where T1 and T2 are the sample totals, and counts1[i] is tested with
/// binomialTwoSidedPval(counts1[i], n_i, q_i).
///
/// A feature with no occurrences, or a sample with no total mass, provides no
/// evidence and gets a p-value of 1.
///
/// Count vectors of different length throw InvalidInputException.
///
/// \return one p-value per feature, in input feature order
std::vector<double>
twoCountsPvals(
    const CountVector& counts1,
    const CountVector& counts2);
