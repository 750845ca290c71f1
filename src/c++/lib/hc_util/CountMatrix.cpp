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

#include "hc_util/CountMatrix.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <cassert>
#include <sstream>



CountMatrix::
CountMatrix(
    const std::vector<CountVector>& denseRows)
    : _colCount(denseRows.empty() ? 0 : denseRows.front().size())
{
    for (const auto& row : denseRows)
    {
        addRow(row);
    }
}



void
CountMatrix::
addRow(
    const CountVector& denseRow)
{
    if (denseRow.size() != _colCount)
    {
        using namespace hcrank::common;
        std::ostringstream oss;
        oss << "Count row has " << denseRow.size() << " entries but the matrix has "
            << _colCount << " columns";
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }

    sparse_row_t row;
    for (unsigned colIndex(0); colIndex<_colCount; ++colIndex)
    {
        if (denseRow[colIndex] == 0) continue;
        row.emplace_back(colIndex, denseRow[colIndex]);
    }
    _rows.push_back(std::move(row));
}



void
CountMatrix::
addSparseRow(
    sparse_row_t sparseRow)
{
    std::sort(sparseRow.begin(), sparseRow.end(),
              [](const entry_t& a, const entry_t& b)
    {
        return a.first < b.first;
    });

    sparse_row_t row;
    for (const auto& entry : sparseRow)
    {
        if (entry.first >= _colCount)
        {
            using namespace hcrank::common;
            std::ostringstream oss;
            oss << "Sparse count entry refers to column " << entry.first
                << " but the matrix has " << _colCount << " columns";
            BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
        }
        if (entry.second == 0) continue;
        if ((! row.empty()) && (row.back().first == entry.first))
        {
            row.back().second += entry.second;
        }
        else
        {
            row.push_back(entry);
        }
    }
    _rows.push_back(std::move(row));
}



const CountMatrix::sparse_row_t&
CountMatrix::
getSparseRow(
    const unsigned rowIndex) const
{
    assert(rowIndex < _rows.size());
    return _rows[rowIndex];
}



CountVector
CountMatrix::
getRow(
    const unsigned rowIndex) const
{
    CountVector row(_colCount,0);
    for (const auto& entry : getSparseRow(rowIndex))
    {
        row[entry.first] = entry.second;
    }
    return row;
}



count_t
CountMatrix::
get(
    const unsigned rowIndex,
    const unsigned colIndex) const
{
    assert(colIndex < _colCount);
    const sparse_row_t& row(getSparseRow(rowIndex));
    const auto iter(std::lower_bound(row.begin(), row.end(), colIndex,
                                     [](const entry_t& entry, const unsigned col)
    {
        return entry.first < col;
    }));
    if ((iter == row.end()) || (iter->first != colIndex)) return 0;
    return iter->second;
}



CountVector
CountMatrix::
rowSums() const
{
    CountVector sums;
    sums.reserve(_rows.size());
    for (const auto& row : _rows)
    {
        count_t sum(0);
        for (const auto& entry : row) sum += entry.second;
        sums.push_back(sum);
    }
    return sums;
}



CountVector
CountMatrix::
columnSums() const
{
    CountVector sums(_colCount,0);
    for (const auto& row : _rows)
    {
        for (const auto& entry : row) sums[entry.first] += entry.second;
    }
    return sums;
}



count_t
CountMatrix::
totalSum() const
{
    count_t sum(0);
    for (const auto& row : _rows)
    {
        for (const auto& entry : row) sum += entry.second;
    }
    return sum;
}



CountMatrix
CountMatrix::
rowSlice(
    const unsigned rowIndex) const
{
    CountMatrix slice(_colCount);
    slice._rows.push_back(getSparseRow(rowIndex));
    return slice;
}



void
CountMatrix::
vstack(
    const CountMatrix& other)
{
    if (other._colCount != _colCount)
    {
        using namespace hcrank::common;
        std::ostringstream oss;
        oss << "Can't stack count matrices with " << _colCount << " and "
            << other._colCount << " columns";
        BOOST_THROW_EXCEPTION(InvalidInputException(oss.str()));
    }
    _rows.insert(_rows.end(), other._rows.begin(), other._rows.end());
}



CountMatrix
CountMatrix::
remapColumns(
    const std::vector<int>& sourceColumns) const
{
    // reverse map from old column to new column(s):
    std::vector<std::vector<unsigned>> targetColumns(_colCount);
    for (unsigned newIndex(0); newIndex<sourceColumns.size(); ++newIndex)
    {
        const int oldIndex(sourceColumns[newIndex]);
        if (oldIndex < 0) continue;
        assert(static_cast<unsigned>(oldIndex) < _colCount);
        targetColumns[oldIndex].push_back(newIndex);
    }

    CountMatrix remapped(sourceColumns.size());
    for (const auto& row : _rows)
    {
        sparse_row_t newRow;
        for (const auto& entry : row)
        {
            for (const unsigned newIndex : targetColumns[entry.first])
            {
                newRow.emplace_back(newIndex, entry.second);
            }
        }
        remapped.addSparseRow(std::move(newRow));
    }
    return remapped;
}



CountMatrix
CountMatrix::
collapsed() const
{
    CountMatrix collapsedMatrix(_colCount);
    collapsedMatrix.addRow(columnSums());
    return collapsedMatrix;
}
