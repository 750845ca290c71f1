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
/// \brief sparse document-by-feature count matrix
///

#pragma once

#include <cstdint>

#include <utility>
#include <vector>


typedef uint64_t count_t;
typedef std::vector<count_t> CountVector;


/// \brief Non-negative integer count matrix with sparse row storage
///
/// Rows are documents and columns are features. Each row holds only its
/// non-zero entries as (column, count) pairs sorted by column.
///
class CountMatrix
{
public:
    typedef std::pair<unsigned,count_t> entry_t;
    typedef std::vector<entry_t> sparse_row_t;

    explicit
    CountMatrix(
        const unsigned colCount = 0)
        : _colCount(colCount)
    {}

    /// \brief Build from dense rows, the column count is taken from the first row
    ///
    /// Rows of differing width throw InvalidInputException
    explicit
    CountMatrix(
        const std::vector<CountVector>& denseRows);

    unsigned
    rowCount() const
    {
        return _rows.size();
    }

    unsigned
    colCount() const
    {
        return _colCount;
    }

    bool
    empty() const
    {
        return _rows.empty();
    }

    /// append a dense row, which must have colCount() entries
    void
    addRow(
        const CountVector& denseRow);

    /// append a sparse row, entries may be unsorted and repeated columns are summed
    void
    addSparseRow(
        sparse_row_t sparseRow);

    const sparse_row_t&
    getSparseRow(
        const unsigned rowIndex) const;

    CountVector
    getRow(
        const unsigned rowIndex) const;

    /// \return count at (rowIndex, colIndex)
    count_t
    get(
        const unsigned rowIndex,
        const unsigned colIndex) const;

    CountVector
    rowSums() const;

    CountVector
    columnSums() const;

    count_t
    totalSum() const;

    /// \return single row matrix holding row \p rowIndex
    CountMatrix
    rowSlice(
        const unsigned rowIndex) const;

    /// append all rows of \p other, column counts must agree
    void
    vstack(
        const CountMatrix& other);

    /// \brief Build a matrix with \p sourceColumns.size() columns, where new column i
    /// copies old column sourceColumns[i], or is zero-filled when sourceColumns[i] < 0
    CountMatrix
    remapColumns(
        const std::vector<int>& sourceColumns) const;

    /// \return single row matrix holding the column sums
    CountMatrix
    collapsed() const;

private:
    unsigned _colCount;
    std::vector<sparse_row_t> _rows;
};
