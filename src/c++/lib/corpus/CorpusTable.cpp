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

#include "corpus/CorpusTable.hh"

#include "common/Exceptions.hh"
#include "corpus/InternalScores.hh"
#include "options/HcOptionsValidate.hh"
#include "stats/PairwiseCountTest.hh"

#include <cassert>
#include <set>
#include <sstream>



CountMatrix
changeVocabulary(
    const CountMatrix& dtm,
    const std::vector<std::string>& oldVocabulary,
    const std::vector<std::string>& newVocabulary,
    unsigned& missingFeatureCount)
{
    assert(oldVocabulary.size() == dtm.colCount());

    std::map<std::string,unsigned> oldIndex;
    const unsigned oldSize(oldVocabulary.size());
    for (unsigned featureIndex(0); featureIndex<oldSize; ++featureIndex)
    {
        oldIndex[oldVocabulary[featureIndex]] = featureIndex;
    }

    missingFeatureCount = 0;
    std::vector<int> sourceColumns;
    sourceColumns.reserve(newVocabulary.size());
    for (const auto& feature : newVocabulary)
    {
        const auto iter(oldIndex.find(feature));
        if (iter == oldIndex.end())
        {
            sourceColumns.push_back(-1);
            missingFeatureCount++;
        }
        else
        {
            sourceColumns.push_back(iter->second);
        }
    }
    return dtm.remapColumns(sourceColumns);
}



/// \return counts - subCounts, throw if any feature would become negative
static
CountVector
subtractWithinCounts(
    const CountVector& counts,
    const CountVector& subCounts,
    const std::vector<std::string>& featureNames)
{
    assert(counts.size() == subCounts.size());

    CountVector result(counts);
    const unsigned featureCount(counts.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        if (subCounts[featureIndex] > counts[featureIndex])
        {
            using namespace hcrank::common;
            std::ostringstream oss;
            oss << "'within' comparison is invalid: count " << subCounts[featureIndex]
                << " of feature '" << featureNames[featureIndex]
                << "' exceeds the table count " << counts[featureIndex]
                << ", so the compared counts can't be a subset of the table";
            BOOST_THROW_EXCEPTION(InvalidSubsetRelationException(oss.str()));
        }
        result[featureIndex] -= subCounts[featureIndex];
    }
    return result;
}



static
std::string
getGeneratedDocumentName(
    const unsigned rowIndex)
{
    std::ostringstream oss;
    oss << "doc" << rowIndex;
    return oss.str();
}



CorpusTable::
CorpusTable(
    const CountMatrix& dtm,
    const std::vector<std::string>& featureNames,
    const std::vector<std::string>& documentNames,
    const HcOptions& opt)
    : _dtm(dtm),
      _featureNames(featureNames),
      _opt(opt)
{
    using namespace hcrank::common;

    validateHcOptions(_opt);

    if (_featureNames.size() != _dtm.colCount())
    {
        std::ostringstream oss;
        oss << "Number of feature names (" << _featureNames.size()
            << ") does not match the number of count matrix columns (" << _dtm.colCount() << ")";
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }

    const unsigned featureCount(_featureNames.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        if (_featureIndex.insert(std::make_pair(_featureNames[featureIndex],featureIndex)).second) continue;
        std::ostringstream oss;
        oss << "Duplicate feature name '" << _featureNames[featureIndex] << "' in table vocabulary";
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }

    const unsigned rowCount(_dtm.rowCount());
    for (unsigned rowIndex(0); rowIndex<rowCount; ++rowIndex)
    {
        std::string name;
        if (rowIndex < documentNames.size())
        {
            name = documentNames[rowIndex];
        }
        else
        {
            name = getGeneratedDocumentName(rowIndex);
        }

        if (! _documentIndex.insert(std::make_pair(name,rowIndex)).second)
        {
            std::ostringstream oss;
            oss << "Duplicate document name '" << name << "' in table";
            BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
        }
        _documentNames.push_back(name);
    }

    if (_dtm.totalSum() == 0)
    {
        BOOST_THROW_EXCEPTION(InvalidInputException(
                                  "All counts in the table are zero. Was the count data passed in the wrong format?"));
    }

    computeInternalStats();
}



void
CorpusTable::
computeInternalStats()
{
    _counts = _dtm.columnSums();
    _documentLengths = _dtm.rowSums();
    _internalScores = computeInternalScores(_dtm,_counts,_opt.isStableHc,_opt.alpha);
}



unsigned
CorpusTable::
getDocumentIndex(
    const std::string& documentName) const
{
    const auto iter(_documentIndex.find(documentName));
    if (iter != _documentIndex.end()) return iter->second;

    using namespace hcrank::common;
    std::ostringstream oss;
    oss << "Document '" << documentName << "' is not in the table";
    BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
}



bool
CorpusTable::
getFeatureIndex(
    const std::string& featureName,
    unsigned& featureIndex) const
{
    const auto iter(_featureIndex.find(featureName));
    if (iter == _featureIndex.end()) return false;
    featureIndex = iter->second;
    return true;
}



std::vector<double>
CorpusTable::
getPvals(
    const CountVector& counts,
    const bool isWithin) const
{
    if (counts.size() != featureCount())
    {
        using namespace hcrank::common;
        std::ostringstream oss;
        oss << "Count vector has " << counts.size() << " features but the table vocabulary has "
            << featureCount();
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }

    if (isWithin)
    {
        return twoCountsPvals(counts,subtractWithinCounts(_counts,counts,_featureNames));
    }
    return twoCountsPvals(counts,_counts);
}



std::vector<double>
CorpusTable::
getPvals(
    const CorpusTable& other,
    std::vector<std::string>& notices) const
{
    return getPvals(getAlignedTable(other,notices).getCounts());
}



CorpusTable
CorpusTable::
getAlignedTable(
    const CorpusTable& other,
    std::vector<std::string>& notices) const
{
    if (other._featureNames == _featureNames) return other;

    std::ostringstream oss;
    oss << "Features of the compared table (" << other.featureCount()
        << ") do not match the table vocabulary (" << featureCount()
        << "). Realigning the compared table to the table vocabulary.";
    notices.push_back(oss.str());
    return other.realignVocabulary(_featureNames);
}



void
CorpusTable::
getAdjustedCounts(
    const CorpusTable& other,
    const bool isWithin,
    CountVector& counts0,
    CountVector& counts1,
    std::vector<std::string>& notices) const
{
    counts1 = getAlignedTable(other,notices).getCounts();
    if (isWithin)
    {
        counts0 = subtractWithinCounts(_counts,counts1,_featureNames);
    }
    else
    {
        counts0 = _counts;
    }
}



TwoTableTestResult
CorpusTable::
twoTableTest(
    const CorpusTable& other,
    const bool isWithin,
    const bool isStableHc,
    std::vector<std::string>& notices) const
{
    CountVector counts0;
    CountVector counts1;
    getAdjustedCounts(other,isWithin,counts0,counts1,notices);

    const std::vector<double> pvals(twoCountsPvals(counts1,counts0));

    TwoTableTestResult result;
    result.hc = higherCriticism(pvals,isStableHc,_opt.alpha);

    const unsigned featureCount(_featureNames.size());
    result.features.resize(featureCount);
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        FeatureTestRecord& record(result.features[featureIndex]);
        record.feature = _featureNames[featureIndex];
        record.count = counts0[featureIndex];
        record.otherCount = counts1[featureIndex];
        record.pval = pvals[featureIndex];
    }
    for (const unsigned featureIndex : getSignificantFeatureIndices(pvals,result.hc.threshold))
    {
        result.features[featureIndex].isSignificant = true;
    }
    return result;
}



std::vector<std::vector<double>>
CorpusTable::
getPerDocumentPvals() const
{
    std::vector<std::vector<double>> pvals;
    const unsigned rowCount(documentCount());
    if (rowCount < 2) return pvals;

    for (unsigned rowIndex(0); rowIndex<rowCount; ++rowIndex)
    {
        pvals.push_back(getRowPvals(_dtm,_counts,rowIndex));
    }
    return pvals;
}



std::vector<std::vector<double>>
CorpusTable::
getPerDocumentPvalsLoo(
    const CorpusTable& candidate,
    std::vector<std::string>& notices) const
{
    const CorpusTable aligned(getAlignedTable(candidate,notices));

    CountMatrix merged(aligned._dtm.collapsed());
    merged.vstack(_dtm);

    CountVector mergedCounts(_counts);
    const unsigned featureCount(mergedCounts.size());
    for (unsigned featureIndex(0); featureIndex<featureCount; ++featureIndex)
    {
        mergedCounts[featureIndex] += aligned._counts[featureIndex];
    }

    std::vector<std::vector<double>> pvals;
    const unsigned rowCount(merged.rowCount());
    for (unsigned rowIndex(0); rowIndex<rowCount; ++rowIndex)
    {
        pvals.push_back(getRowPvals(merged,mergedCounts,rowIndex));
    }
    return pvals;
}



CorpusTable
CorpusTable::
realignVocabulary(
    const std::vector<std::string>& newVocabulary) const
{
    unsigned missingFeatureCount(0);
    const CountMatrix newDtm(changeVocabulary(_dtm,_featureNames,newVocabulary,missingFeatureCount));
    if (newDtm.totalSum() == 0)
    {
        using namespace hcrank::common;
        std::ostringstream oss;
        oss << "Realigned table has no counts, " << missingFeatureCount << " of " << newVocabulary.size()
            << " features in the new vocabulary are missing from the table vocabulary";
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }
    return CorpusTable(newDtm,newVocabulary,_documentNames,_opt);
}



CorpusTable
CorpusTable::
merge(
    const CorpusTable* other,
    std::vector<std::string>& notices) const
{
    if (other == nullptr) return copy();

    const CorpusTable aligned(getAlignedTable(*other,notices));

    CountMatrix mergedDtm(_dtm);
    mergedDtm.vstack(aligned._dtm);

    // documents of other with a name already in use are renamed after their merged row:
    std::vector<std::string> mergedNames(_documentNames);
    std::set<std::string> usedNames(_documentNames.begin(),_documentNames.end());
    unsigned renamedCount(0);
    for (const auto& name : aligned._documentNames)
    {
        std::string mergedName(name);
        if (usedNames.count(mergedName) != 0)
        {
            const std::string rowName(getGeneratedDocumentName(mergedNames.size()));
            mergedName = rowName;
            for (unsigned suffix(1); usedNames.count(mergedName) != 0; ++suffix)
            {
                std::ostringstream oss;
                oss << rowName << "_" << suffix;
                mergedName = oss.str();
            }
            renamedCount++;
        }
        usedNames.insert(mergedName);
        mergedNames.push_back(mergedName);
    }

    if (renamedCount > 0)
    {
        std::ostringstream oss;
        oss << "Renamed " << renamedCount << " merged document(s) whose names are already used in the table.";
        notices.push_back(oss.str());
    }

    return CorpusTable(mergedDtm,_featureNames,mergedNames,_opt);
}



CorpusTable
CorpusTable::
extractDocument(
    const std::string& documentName) const
{
    const unsigned rowIndex(getDocumentIndex(documentName));
    return CorpusTable(_dtm.rowSlice(rowIndex),_featureNames,
                       std::vector<std::string>(1,documentName),_opt);
}



void
CorpusTable::
collapse()
{
    *this = CorpusTable(_dtm.collapsed(),_featureNames,std::vector<std::string>(1,"collapsed"),_opt);
}



ChiSquareResult
CorpusTable::
getChiSquare(
    const CorpusTable& other,
    const bool isWithin,
    const POWER_DIVERGENCE type,
    std::vector<std::string>& notices) const
{
    CountVector counts0;
    CountVector counts1;
    getAdjustedCounts(other,isWithin,counts0,counts1,notices);
    return twoSampleChiSquare(counts0,counts1,type);
}



KsResult
CorpusTable::
getKolmogorovSmirnov(
    const CorpusTable& other,
    const bool isWithin,
    std::vector<std::string>& notices) const
{
    CountVector counts0;
    CountVector counts1;
    getAdjustedCounts(other,isWithin,counts0,counts1,notices);
    return twoSampleKs(counts0,counts1);
}



double
CorpusTable::
getCosineSimilarity(
    const CorpusTable& other,
    const bool isWithin,
    std::vector<std::string>& notices) const
{
    CountVector counts0;
    CountVector counts1;
    getAdjustedCounts(other,isWithin,counts0,counts1,notices);
    return cosineSimilarity(counts0,counts1);
}
