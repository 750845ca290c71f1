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
/// \brief whole-distribution comparisons of two count vectors over the same features
///
/// Both count vectors are treated as the two rows of a 2 x k contingency
/// table, or as two histograms over the feature order.
///

#pragma once

#include "hc_util/CountMatrix.hh"

#include <limits>


/// \brief Cressie-Read power divergence family members
///
enum class POWER_DIVERGENCE
{
    PEARSON,
    LOG_LIKELIHOOD,
    FREEMAN_TUKEY,
    MOD_LOG_LIKELIHOOD,
    NEYMAN,
    CRESSIE_READ
};

/// \return lambda exponent of the power divergence statistic
double
getPowerDivergenceLambda(
    const POWER_DIVERGENCE type);


struct ChiSquareResult
{
    double statistic = 0.;
    double pval = 1.;
    unsigned dof = 0;
};


/// \brief power divergence test of independence on the 2 x k table formed by two count vectors
///
/// Features with no counts in either vector are dropped. For the members with
/// negative lambda any feature with a zero count is dropped as well. A table
/// left with fewer than 2 features, or a vector with no counts, gives
/// statistic 0 and p-value 1.
ChiSquareResult
twoSampleChiSquare(
    const CountVector& counts1,
    const CountVector& counts2,
    const POWER_DIVERGENCE type = POWER_DIVERGENCE::LOG_LIKELIHOOD);


struct KsResult
{
    double statistic = std::numeric_limits<double>::quiet_NaN();
    double pval = std::numeric_limits<double>::quiet_NaN();
};


/// \brief two-sample Kolmogorov-Smirnov test between two count histograms
///
/// The statistic is the largest absolute difference between the cumulative
/// distributions over the feature order. The p-value uses the asymptotic
/// Kolmogorov distribution with effective sample size T1*T2/(T1+T2).
///
/// Result is NaN if either vector has no counts.
KsResult
twoSampleKs(
    const CountVector& counts1,
    const CountVector& counts2);


/// \brief Kolmogorov distribution survival function Q_KS(lambda)
double
kolmogorovSf(
    const double lambda);


/// \return cosine of the angle between the two count vectors, NaN if either is all zero
double
cosineSimilarity(
    const CountVector& counts1,
    const CountVector& counts2);
