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

#include "stats/TwoSampleMeasures.hh"

#include "common/Exceptions.hh"

#include <boost/math/distributions/chi_squared.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

using boost::math::cdf;
using boost::math::chi_squared;
using boost::math::complement;



static
void
checkCountVectorSizes(
    const CountVector& counts1,
    const CountVector& counts2)
{
    if (counts1.size() == counts2.size()) return;

    using namespace hcrank::common;
    std::ostringstream oss;
    oss << "Can't compare count vectors of different length: "
        << counts1.size() << " vs. " << counts2.size();
    BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
}



double
getPowerDivergenceLambda(
    const POWER_DIVERGENCE type)
{
    switch (type)
    {
    case POWER_DIVERGENCE::PEARSON:
        return 1.;
    case POWER_DIVERGENCE::LOG_LIKELIHOOD:
        return 0.;
    case POWER_DIVERGENCE::FREEMAN_TUKEY:
        return -0.5;
    case POWER_DIVERGENCE::MOD_LOG_LIKELIHOOD:
        return -1.;
    case POWER_DIVERGENCE::NEYMAN:
        return -2.;
    case POWER_DIVERGENCE::CRESSIE_READ:
        return 2./3.;
    default:
        break;
    }

    using namespace hcrank::common;
    BOOST_THROW_EXCEPTION(LogicException("Unknown power divergence type"));
}



/// contribution of one table cell to the power divergence sum
static
double
powerDivergenceTerm(
    const double obs,
    const double expect,
    const double lambda)
{
    if (lambda == 0.)
    {
        if (obs <= 0.) return 0.;
        return obs*std::log(obs/expect);
    }
    if (lambda == -1.)
    {
        return expect*std::log(expect/obs);
    }
    return obs*(std::pow(obs/expect,lambda)-1.)/(lambda*(lambda+1.));
}



ChiSquareResult
twoSampleChiSquare(
    const CountVector& counts1,
    const CountVector& counts2,
    const POWER_DIVERGENCE type)
{
    checkCountVectorSizes(counts1,counts2);

    const double lambda(getPowerDivergenceLambda(type));
    const bool isDropAnyZero(lambda < 0.);

    std::vector<unsigned> columns;
    double rowSum1(0);
    double rowSum2(0);
    const unsigned featureCount(counts1.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        const count_t c1(counts1[featureIndex]);
        const count_t c2(counts2[featureIndex]);
        if (isDropAnyZero)
        {
            if ((c1 == 0) || (c2 == 0)) continue;
        }
        else
        {
            if ((c1 == 0) && (c2 == 0)) continue;
        }
        columns.push_back(featureIndex);
        rowSum1 += c1;
        rowSum2 += c2;
    }

    ChiSquareResult result;
    if ((columns.size() < 2) || (rowSum1 <= 0.) || (rowSum2 <= 0.)) return result;

    const double total(rowSum1+rowSum2);
    double sum(0.);
    for (const unsigned featureIndex : columns)
    {
        const double c1(counts1[featureIndex]);
        const double c2(counts2[featureIndex]);
        const double colSum(c1+c2);
        sum += powerDivergenceTerm(c1,rowSum1*colSum/total,lambda);
        sum += powerDivergenceTerm(c2,rowSum2*colSum/total,lambda);
    }

    result.statistic = std::max(0.,2.*sum);
    result.dof = columns.size()-1;

    const chi_squared dist(result.dof);
    result.pval = cdf(complement(dist,result.statistic));
    return result;
}



double
kolmogorovSf(
    const double lambda)
{
    if (lambda <= 0.) return 1.;

    static const unsigned maxTerms(100);
    static const double eps1(0.001);
    static const double eps2(1.0e-8);

    const double a2(-2.*lambda*lambda);
    double sign(2.);
    double sum(0.);
    double prevTerm(0.);
    for (unsigned j(1); j<=maxTerms; ++j)
    {
        const double term(sign*std::exp(a2*j*j));
        sum += term;
        if ((std::abs(term) <= eps1*prevTerm) || (std::abs(term) <= eps2*sum))
        {
            return std::min(1.,std::max(0.,sum));
        }
        sign = -sign;
        prevTerm = std::abs(term);
    }

    // series failed to converge, which only happens for lambda near 0:
    return 1.;
}



KsResult
twoSampleKs(
    const CountVector& counts1,
    const CountVector& counts2)
{
    checkCountVectorSizes(counts1,counts2);

    double total1(0.);
    double total2(0.);
    const unsigned featureCount(counts1.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        total1 += counts1[featureIndex];
        total2 += counts2[featureIndex];
    }

    KsResult result;
    if ((total1 <= 0.) || (total2 <= 0.)) return result;

    double cum1(0.);
    double cum2(0.);
    double maxDiff(0.);
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        cum1 += counts1[featureIndex];
        cum2 += counts2[featureIndex];
        maxDiff = std::max(maxDiff,std::abs(cum1/total1-cum2/total2));
    }

    const double en(std::sqrt(total1*total2/(total1+total2)));
    result.statistic = maxDiff;
    result.pval = kolmogorovSf((en+0.12+0.11/en)*maxDiff);
    return result;
}



double
cosineSimilarity(
    const CountVector& counts1,
    const CountVector& counts2)
{
    checkCountVectorSizes(counts1,counts2);

    double dot(0.);
    double norm1(0.);
    double norm2(0.);
    const unsigned featureCount(counts1.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        const double c1(counts1[featureIndex]);
        const double c2(counts2[featureIndex]);
        dot += c1*c2;
        norm1 += c1*c1;
        norm2 += c2*c2;
    }

    if ((norm1 <= 0.) || (norm2 <= 0.)) return std::numeric_limits<double>::quiet_NaN();
    return dot/std::sqrt(norm1*norm2);
}
