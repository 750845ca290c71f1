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
/// \brief document-by-feature count table with internal HC calibration scores
///

#pragma once

#include "hc_util/CountMatrix.hh"
#include "options/HcOptions.hh"
#include "stats/HigherCriticism.hh"
#include "stats/TwoSampleMeasures.hh"

#include <map>
#include <string>
#include <vector>


/// \brief Copy the columns of \p dtm into the order given by \p newVocabulary
///
/// Features of \p newVocabulary missing from \p oldVocabulary are zero-filled,
/// features of \p oldVocabulary missing from \p newVocabulary are dropped.
///
/// \param[out] missingFeatureCount number of zero-filled features
CountMatrix
changeVocabulary(
    const CountMatrix& dtm,
    const std::vector<std::string>& oldVocabulary,
    const std::vector<std::string>& newVocabulary,
    unsigned& missingFeatureCount);


/// \brief per-feature line of a two-table comparison
struct FeatureTestRecord
{
    std::string feature;
    count_t count = 0;
    count_t otherCount = 0;
    double pval = 1.;
    bool isSignificant = false;
};


struct TwoTableTestResult
{
    std::vector<FeatureTestRecord> features;
    HcResult hc;
};


/// \brief Document-term count table used as the reference population for HC tests
///
/// The table keeps the column sums of its count matrix and, for each document,
/// the HC score of the document against the rest of the table. These internal
/// scores form the calibration distribution for rank evaluation. Every
/// operation changing the matrix rebuilds all derived state.
///
/// Operations comparing against another table require identical vocabularies.
/// When the vocabularies differ a realigned copy of the other table is used
/// instead, and a notice describing the change is appended to \p notices.
///
class CorpusTable
{
public:
    /// \param[in] dtm count matrix, must contain at least one non-zero count
    /// \param[in] featureNames unique name of each matrix column
    /// \param[in] documentNames unique row names, missing names are generated as 'doc<row>'
    /// \param[in] opt HC configuration used for the internal scores
    CorpusTable(
        const CountMatrix& dtm,
        const std::vector<std::string>& featureNames,
        const std::vector<std::string>& documentNames = std::vector<std::string>(),
        const HcOptions& opt = HcOptions());

    const CountVector&
    getCounts() const
    {
        return _counts;
    }

    /// total count of each document
    const CountVector&
    getDocumentLengths() const
    {
        return _documentLengths;
    }

    const std::vector<std::string>&
    getFeatureNames() const
    {
        return _featureNames;
    }

    /// document names in row order
    const std::vector<std::string>&
    getDocumentNames() const
    {
        return _documentNames;
    }

    /// \return row of \p documentName, throws InvalidInputException for an unknown name
    unsigned
    getDocumentIndex(
        const std::string& documentName) const;

    /// \return true and set \p featureIndex if \p featureName is in the vocabulary
    bool
    getFeatureIndex(
        const std::string& featureName,
        unsigned& featureIndex) const;

    /// HC score of each document against the rest of the table, empty for a single document table
    const std::vector<double>&
    getInternalScores() const
    {
        return _internalScores;
    }

    const CountMatrix&
    getMatrix() const
    {
        return _dtm;
    }

    const HcOptions&
    getOptions() const
    {
        return _opt;
    }

    bool
    isStableHc() const
    {
        return _opt.isStableHc;
    }

    unsigned
    documentCount() const
    {
        return _dtm.rowCount();
    }

    unsigned
    featureCount() const
    {
        return _featureNames.size();
    }

    /// \brief p-values of \p counts against the table counts
    ///
    /// \param[in] isWithin if true, \p counts are taken to be part of the table and
    ///                     are subtracted from the table counts first. Throws
    ///                     InvalidSubsetRelationException if this leaves a negative count.
    std::vector<double>
    getPvals(
        const CountVector& counts,
        const bool isWithin = false) const;

    /// p-values of the counts of \p other against the table counts
    std::vector<double>
    getPvals(
        const CorpusTable& other,
        std::vector<std::string>& notices) const;

    /// \brief return \p other realigned to this table's vocabulary if required
    CorpusTable
    getAlignedTable(
        const CorpusTable& other,
        std::vector<std::string>& notices) const;

    /// \brief counts of this table and \p other as used by all two-table measures
    ///
    /// \param[out] counts0 table counts, less the counts of \p other if \p isWithin
    /// \param[out] counts1 counts of \p other
    void
    getAdjustedCounts(
        const CorpusTable& other,
        const bool isWithin,
        CountVector& counts0,
        CountVector& counts1,
        std::vector<std::string>& notices) const;

    /// \brief per-feature counts, p-values and HC significance of \p other against this table
    TwoTableTestResult
    twoTableTest(
        const CorpusTable& other,
        const bool isWithin,
        const bool isStableHc,
        std::vector<std::string>& notices) const;

    /// p-values of each document against the rest of the table
    std::vector<std::vector<double>>
    getPerDocumentPvals() const;

    /// \brief p-values of each document of the table extended by \p candidate against the rest
    ///
    /// The candidate counts form the first document of the extended table, so the
    /// first vector of the result belongs to the candidate.
    std::vector<std::vector<double>>
    getPerDocumentPvalsLoo(
        const CorpusTable& candidate,
        std::vector<std::string>& notices) const;

    /// \brief new table with columns in the order of \p newVocabulary
    ///
    /// see changeVocabulary()
    CorpusTable
    realignVocabulary(
        const std::vector<std::string>& newVocabulary) const;

    /// \brief new table holding the documents of this table followed by those of \p other
    ///
    /// A null \p other returns a copy of this table. A document of \p other whose
    /// name is already used is renamed "doc<row>" after its row in the merged table.
    CorpusTable
    merge(
        const CorpusTable* other,
        std::vector<std::string>& notices) const;

    /// single document table for \p documentName
    CorpusTable
    extractDocument(
        const std::string& documentName) const;

    /// \brief replace all documents by a single document holding the table counts
    ///
    /// Per-document structure is lost and the internal scores become empty.
    void
    collapse();

    CorpusTable
    copy() const
    {
        return *this;
    }

    ChiSquareResult
    getChiSquare(
        const CorpusTable& other,
        const bool isWithin,
        const POWER_DIVERGENCE type,
        std::vector<std::string>& notices) const;

    KsResult
    getKolmogorovSmirnov(
        const CorpusTable& other,
        const bool isWithin,
        std::vector<std::string>& notices) const;

    double
    getCosineSimilarity(
        const CorpusTable& other,
        const bool isWithin,
        std::vector<std::string>& notices) const;

private:
    /// rebuild counts, document lengths and internal scores from _dtm
    void
    computeInternalStats();

    CountMatrix _dtm;
    std::vector<std::string> _featureNames;
    std::vector<std::string> _documentNames;
    std::map<std::string,unsigned> _featureIndex;
    std::map<std::string,unsigned> _documentIndex;
    HcOptions _opt;

    CountVector _counts;
    CountVector _documentLengths;
    std::vector<double> _internalScores;
};
