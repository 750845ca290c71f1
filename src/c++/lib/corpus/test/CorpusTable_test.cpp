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

#include "boost/test/unit_test.hpp"

#include "corpus/CorpusTable.hh"

#include "common/Exceptions.hh"
#include "stats/PairwiseCountTest.hh"

#include <cmath>
#include <set>


BOOST_AUTO_TEST_SUITE( test_CorpusTable )

using namespace hcrank::common;


static
std::vector<std::string>
getVocabulary()
{
    return {"w1","w2","w3","w4","w5"};
}


/// three single-word documents
static
CorpusTable
getSimpleTable()
{
    const CountMatrix dtm({{10,0,0,0,0},{0,10,0,0,0},{0,0,10,0,0}});
    return CorpusTable(dtm,getVocabulary());
}


static
CorpusTable
getMixedTable()
{
    const CountMatrix dtm({{10,2,0,1,0},{3,8,1,0,2},{0,1,9,4,0},{2,2,2,2,2}});
    return CorpusTable(dtm,getVocabulary(),{"a","b","c","d"});
}


static
void
requireEqualCounts(
    const CountVector& a,
    const CountVector& b)
{
    BOOST_REQUIRE_EQUAL_COLLECTIONS(a.begin(), a.end(), b.begin(), b.end());
}


static
void
requireEqualScores(
    const std::vector<double>& a,
    const std::vector<double>& b)
{
    BOOST_REQUIRE_EQUAL(a.size(), b.size());
    for (unsigned i(0); i<a.size(); ++i)
    {
        BOOST_REQUIRE_CLOSE(a[i], b[i], 0.0001);
    }
}


BOOST_AUTO_TEST_CASE( test_construct )
{
    const CorpusTable table(getSimpleTable());

    requireEqualCounts(table.getCounts(), {10,10,10,0,0});
    requireEqualCounts(table.getDocumentLengths(), {10,10,10});
    BOOST_REQUIRE_EQUAL(table.documentCount(), 3u);
    BOOST_REQUIRE_EQUAL(table.featureCount(), 5u);
    BOOST_REQUIRE(table.isStableHc());

    const std::vector<std::string>& names(table.getDocumentNames());
    BOOST_REQUIRE_EQUAL(names.size(), 3u);
    BOOST_REQUIRE_EQUAL(names[0], "doc0");
    BOOST_REQUIRE_EQUAL(names[2], "doc2");
    BOOST_REQUIRE_EQUAL(table.getDocumentIndex("doc1"), 1u);

    unsigned featureIndex(0);
    BOOST_REQUIRE(table.getFeatureIndex("w4",featureIndex));
    BOOST_REQUIRE_EQUAL(featureIndex, 3u);
    BOOST_REQUIRE(! table.getFeatureIndex("w9",featureIndex));
}


BOOST_AUTO_TEST_CASE( test_construct_partial_document_names )
{
    const CountMatrix dtm({{1,0},{0,1},{1,1}});
    const CorpusTable table(dtm,{"x","y"},{"first"});

    const std::vector<std::string>& names(table.getDocumentNames());
    BOOST_REQUIRE_EQUAL(names[0], "first");
    BOOST_REQUIRE_EQUAL(names[1], "doc1");
    BOOST_REQUIRE_EQUAL(names[2], "doc2");
}


BOOST_AUTO_TEST_CASE( test_construct_invalid )
{
    // all-zero count matrix:
    const CountMatrix zero({{0,0,0,0},{0,0,0,0},{0,0,0,0}});
    BOOST_REQUIRE_THROW(CorpusTable(zero,{"a","b","c","d"}), InvalidInputException);

    const CountMatrix dtm({{1,2},{3,4}});
    BOOST_REQUIRE_THROW(CorpusTable(dtm,{"a"}), InvalidInputException);
    BOOST_REQUIRE_THROW(CorpusTable(dtm,{"a","a"}), InvalidInputException);
    BOOST_REQUIRE_THROW(CorpusTable(dtm,{"a","b"},{"d","d"}), InvalidInputException);

    HcOptions opt;
    opt.alpha = 2.;
    BOOST_REQUIRE_THROW(CorpusTable(dtm,{"a","b"},{},opt), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( test_internal_scores )
{
    const CorpusTable table(getMixedTable());
    const std::vector<double>& scores(table.getInternalScores());
    BOOST_REQUIRE_EQUAL(scores.size(), 4u);

    // each internal score is the document tested against the rest of the table:
    const std::vector<std::vector<double>> perDocPvals(table.getPerDocumentPvals());
    BOOST_REQUIRE_EQUAL(perDocPvals.size(), 4u);
    for (unsigned rowIndex(0); rowIndex<4; ++rowIndex)
    {
        const CountVector row(table.getMatrix().getRow(rowIndex));
        const std::vector<double> pvals(table.getPvals(row,true));
        const HcResult hc(higherCriticism(pvals,true));
        BOOST_REQUIRE_EQUAL(hc.score, scores[rowIndex]);
        BOOST_REQUIRE_EQUAL_COLLECTIONS(pvals.begin(), pvals.end(),
                                        perDocPvals[rowIndex].begin(), perDocPvals[rowIndex].end());
    }
}


BOOST_AUTO_TEST_CASE( test_getPvals )
{
    const CorpusTable table(getSimpleTable());

    const std::vector<double> pvals(table.getPvals({9,1,0,0,0}));
    BOOST_REQUIRE_EQUAL(pvals.size(), 5u);
    for (const double pval : pvals)
    {
        BOOST_REQUIRE((pval >= 0.) && (pval <= 1.));
    }

    BOOST_REQUIRE_THROW(table.getPvals({1,2,3}), InvalidInputException);

    // candidate can't be a subset of the table if it has more of 'w1':
    BOOST_REQUIRE_THROW(table.getPvals({11,0,0,0,0},true), InvalidSubsetRelationException);
    BOOST_REQUIRE_THROW(table.getPvals({0,0,0,1,0},true), InvalidSubsetRelationException);
    BOOST_REQUIRE_NO_THROW(table.getPvals({10,0,0,0,0},true));
}


BOOST_AUTO_TEST_CASE( test_concentrated_candidate_scores_higher )
{
    const CorpusTable table(getSimpleTable());

    const HcResult concentrated(higherCriticism(table.getPvals({9,1,0,0,0}),true));
    const HcResult uniform(higherCriticism(table.getPvals({4,3,3,0,0}),true));
    BOOST_REQUIRE(concentrated.isDefined());
    BOOST_REQUIRE(uniform.isDefined());
    BOOST_REQUIRE(concentrated.score > (uniform.score + 1.));
}


BOOST_AUTO_TEST_CASE( test_changeVocabulary )
{
    const CountMatrix dtm({{1,2,3},{4,5,6}});
    unsigned missingFeatureCount(0);
    const CountMatrix newDtm(changeVocabulary(dtm,{"a","b","c"},{"c","x","a"},missingFeatureCount));

    BOOST_REQUIRE_EQUAL(missingFeatureCount, 1u);
    requireEqualCounts(newDtm.getRow(0), {3,0,1});
    requireEqualCounts(newDtm.getRow(1), {6,0,4});
}


BOOST_AUTO_TEST_CASE( test_realign_identity )
{
    const CorpusTable table(getMixedTable());
    const CorpusTable realigned(table.realignVocabulary(table.getFeatureNames()));

    requireEqualCounts(realigned.getCounts(), table.getCounts());
    requireEqualScores(realigned.getInternalScores(), table.getInternalScores());
    BOOST_REQUIRE(realigned.getDocumentNames() == table.getDocumentNames());
}


BOOST_AUTO_TEST_CASE( test_realign )
{
    const CorpusTable table(getSimpleTable());
    const std::vector<std::string> newVocabulary = {"w3","w1","w9"};
    const CorpusTable realigned(table.realignVocabulary(newVocabulary));

    BOOST_REQUIRE(realigned.getFeatureNames() == newVocabulary);
    requireEqualCounts(realigned.getCounts(), {10,10,0});
    requireEqualCounts(realigned.getMatrix().getRow(2), {10,0,0});
    BOOST_REQUIRE_EQUAL(realigned.getInternalScores().size(), 3u);

    // narrowing to features without counts leaves an invalid table:
    BOOST_REQUIRE_THROW(table.realignVocabulary({"w4","w5"}), InvalidInputException);
}


BOOST_AUTO_TEST_CASE( test_merge_null )
{
    const CorpusTable table(getMixedTable());
    std::vector<std::string> notices;
    const CorpusTable merged(table.merge(nullptr,notices));
    const CorpusTable copied(table.copy());

    BOOST_REQUIRE(notices.empty());
    requireEqualCounts(merged.getCounts(), copied.getCounts());
    BOOST_REQUIRE_EQUAL(merged.documentCount(), copied.documentCount());
    requireEqualScores(merged.getInternalScores(), copied.getInternalScores());
}


BOOST_AUTO_TEST_CASE( test_merge )
{
    const CorpusTable table(getSimpleTable());
    const CountMatrix otherDtm({{0,0,0,5,5}});
    const CorpusTable other(otherDtm,getVocabulary(),{"extra"});

    std::vector<std::string> notices;
    const CorpusTable merged(table.merge(&other,notices));
    BOOST_REQUIRE(notices.empty());
    BOOST_REQUIRE_EQUAL(merged.documentCount(), 4u);
    requireEqualCounts(merged.getCounts(), {10,10,10,5,5});
    BOOST_REQUIRE_EQUAL(merged.getDocumentNames()[3], "extra");
    BOOST_REQUIRE_EQUAL(merged.getDocumentNames()[0], "doc0");
    BOOST_REQUIRE_EQUAL(merged.getInternalScores().size(), 4u);
}


BOOST_AUTO_TEST_CASE( test_merge_generated_names )
{
    // both tables use generated names for their documents
    const CorpusTable table(getSimpleTable());
    const CountMatrix otherDtm({{0,0,0,5,5}});
    const CorpusTable other(otherDtm,getVocabulary());

    std::vector<std::string> notices;
    const CorpusTable merged(table.merge(&other,notices));
    BOOST_REQUIRE_EQUAL(notices.size(), 1u);
    BOOST_REQUIRE_EQUAL(merged.documentCount(), 4u);
    const std::vector<std::string> expectNames = {"doc0","doc1","doc2","doc3"};
    BOOST_REQUIRE(merged.getDocumentNames() == expectNames);
    requireEqualCounts(merged.getMatrix().getRow(3), {0,0,0,5,5});

    // a self merge renames every document of the second copy
    notices.clear();
    const CorpusTable selfMerged(merged.merge(&merged,notices));
    BOOST_REQUIRE_EQUAL(notices.size(), 1u);
    const std::vector<std::string>& names(selfMerged.getDocumentNames());
    BOOST_REQUIRE_EQUAL(names.size(), 8u);
    BOOST_REQUIRE_EQUAL(names[4], "doc4");
    BOOST_REQUIRE_EQUAL(names[7], "doc7");
    const std::set<std::string> uniqueNames(names.begin(), names.end());
    BOOST_REQUIRE_EQUAL(uniqueNames.size(), names.size());
    BOOST_REQUIRE_EQUAL(selfMerged.getInternalScores().size(), 8u);

    // the row name is suffixed when it is already taken
    notices.clear();
    const CountMatrix namedDtm({{1,0,0,0,0},{0,1,0,0,0}});
    const CorpusTable named(namedDtm,getVocabulary(),{"x","doc2"});
    const CountMatrix xDtm({{0,0,1,0,0}});
    const CorpusTable xTable(xDtm,getVocabulary(),{"x"});
    const CorpusTable suffixed(named.merge(&xTable,notices));
    const std::vector<std::string> expectSuffixedNames = {"x","doc2","doc2_1"};
    BOOST_REQUIRE(suffixed.getDocumentNames() == expectSuffixedNames);
    BOOST_REQUIRE_EQUAL(suffixed.getDocumentIndex("doc2_1"), 2u);
}


BOOST_AUTO_TEST_CASE( test_merge_realign )
{
    const CorpusTable table(getSimpleTable());
    const CountMatrix otherDtm({{7,1,2}});
    const CorpusTable other(otherDtm,{"w2","w1","w7"},{"extra"});

    std::vector<std::string> notices;
    const CorpusTable merged(table.merge(&other,notices));
    BOOST_REQUIRE_EQUAL(notices.size(), 1u);
    BOOST_REQUIRE(merged.getFeatureNames() == getVocabulary());
    requireEqualCounts(merged.getCounts(), {11,17,10,0,0});
}


BOOST_AUTO_TEST_CASE( test_extractDocument )
{
    const CorpusTable table(getMixedTable());
    const CorpusTable doc(table.extractDocument("b"));

    BOOST_REQUIRE_EQUAL(doc.documentCount(), 1u);
    BOOST_REQUIRE(doc.getInternalScores().empty());
    BOOST_REQUIRE(doc.getFeatureNames() == table.getFeatureNames());
    BOOST_REQUIRE_EQUAL(doc.getDocumentNames()[0], "b");
    requireEqualCounts(doc.getCounts(), {3,8,1,0,2});

    BOOST_REQUIRE_THROW(table.extractDocument("missing"), InvalidInputException);
}


BOOST_AUTO_TEST_CASE( test_collapse )
{
    CorpusTable table(getMixedTable());
    const CountVector counts(table.getCounts());

    table.collapse();
    BOOST_REQUIRE_EQUAL(table.documentCount(), 1u);
    BOOST_REQUIRE(table.getInternalScores().empty());
    requireEqualCounts(table.getCounts(), counts);
    requireEqualCounts(table.getMatrix().getRow(0), counts);
    BOOST_REQUIRE_EQUAL(table.getDocumentNames()[0], "collapsed");
    BOOST_REQUIRE(table.getPerDocumentPvals().empty());
}


BOOST_AUTO_TEST_CASE( test_copy_is_independent )
{
    const CorpusTable table(getMixedTable());
    CorpusTable copied(table.copy());
    copied.collapse();

    BOOST_REQUIRE_EQUAL(table.documentCount(), 4u);
    BOOST_REQUIRE_EQUAL(table.getInternalScores().size(), 4u);
}


BOOST_AUTO_TEST_CASE( test_two_table_measures )
{
    const CorpusTable table(getMixedTable());
    std::vector<std::string> notices;

    BOOST_REQUIRE_SMALL(table.getChiSquare(table,false,POWER_DIVERGENCE::PEARSON,notices).statistic, 1e-9);
    BOOST_REQUIRE_CLOSE(table.getCosineSimilarity(table,false,notices), 1., 0.0001);
    BOOST_REQUIRE_SMALL(table.getKolmogorovSmirnov(table,false,notices).statistic, 1e-12);
    BOOST_REQUIRE(notices.empty());

    // within a table, a single document is compared to the rest:
    const CorpusTable doc(table.extractDocument("a"));
    const ChiSquareResult chiSquare(table.getChiSquare(doc,true,POWER_DIVERGENCE::LOG_LIKELIHOOD,notices));
    BOOST_REQUIRE(chiSquare.statistic > 0.);
    BOOST_REQUIRE(chiSquare.pval < 1.);

    const double cosine(table.getCosineSimilarity(doc,true,notices));
    BOOST_REQUIRE((cosine > 0.) && (cosine < 1.));

    const CountMatrix bigDtm({{100,0,0,0,0}});
    const CorpusTable big(bigDtm,getVocabulary());
    BOOST_REQUIRE_THROW(table.getCosineSimilarity(big,true,notices), InvalidSubsetRelationException);
}


BOOST_AUTO_TEST_CASE( test_twoTableTest )
{
    const CorpusTable table(getSimpleTable());
    const CountMatrix otherDtm({{9,1,0,0,0}});
    const CorpusTable other(otherDtm,getVocabulary());

    std::vector<std::string> notices;
    const TwoTableTestResult result(table.twoTableTest(other,false,true,notices));

    BOOST_REQUIRE_EQUAL(result.features.size(), 5u);
    BOOST_REQUIRE_EQUAL(result.features[0].feature, "w1");
    BOOST_REQUIRE_EQUAL(result.features[0].count, 10u);
    BOOST_REQUIRE_EQUAL(result.features[0].otherCount, 9u);

    const std::vector<double> pvals(table.getPvals(other,notices));
    const HcResult hc(higherCriticism(pvals,true));
    BOOST_REQUIRE_EQUAL(result.hc.score, hc.score);
    for (unsigned featureIndex(0); featureIndex<5; ++featureIndex)
    {
        BOOST_REQUIRE_EQUAL(result.features[featureIndex].pval, pvals[featureIndex]);
        BOOST_REQUIRE_EQUAL(result.features[featureIndex].isSignificant, (pvals[featureIndex] < hc.threshold));
    }
    BOOST_REQUIRE(notices.empty());
}


BOOST_AUTO_TEST_CASE( test_getPvals_realign_notice )
{
    const CorpusTable table(getSimpleTable());
    const CountMatrix otherDtm({{1,9}});
    const CorpusTable other(otherDtm,{"w1","w6"});

    std::vector<std::string> notices;
    const std::vector<double> pvals(table.getPvals(other,notices));
    BOOST_REQUIRE_EQUAL(notices.size(), 1u);
    BOOST_REQUIRE_EQUAL(pvals.size(), 5u);
}


BOOST_AUTO_TEST_CASE( test_getPerDocumentPvalsLoo )
{
    const CorpusTable table(getMixedTable());
    const CountMatrix candidateDtm({{5,5,0,0,0}});
    const CorpusTable candidate(candidateDtm,getVocabulary());

    std::vector<std::string> notices;
    const std::vector<std::vector<double>> pvals(table.getPerDocumentPvalsLoo(candidate,notices));
    BOOST_REQUIRE_EQUAL(pvals.size(), 5u);

    // the first document is the candidate against the whole table:
    const std::vector<double> candidatePvals(table.getPvals(candidate.getCounts()));
    BOOST_REQUIRE_EQUAL_COLLECTIONS(pvals[0].begin(), pvals[0].end(),
                                    candidatePvals.begin(), candidatePvals.end());
}


BOOST_AUTO_TEST_SUITE_END()
