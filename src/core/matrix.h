// Copyright (c) 2019-2021, NVIDIA CORPORATION. All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions
// are met:
//  * Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
//  * Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
//  * Neither the name of NVIDIA CORPORATION nor the names of its
//    contributors may be used to endorse or promote products derived
//    from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS ``AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
// PURPOSE ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT OWNER OR
// CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
// EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
// PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY
// OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include <stddef.h>
#include <map>
#include <string>
#include <vector>
#include "src/core/status.h"

namespace modelrunner {

//
// Dense row-major matrix of doubles. Rows are samples, columns are
// features (for inputs) or predicted values (for outputs).
//
class Matrix {
 public:
  Matrix() : rows_(0), cols_(0) {}
  Matrix(const size_t rows, const size_t cols, const double value = 0.0)
      : rows_(rows), cols_(cols), data_(rows * cols, value)
  {
  }

  /// Build a matrix from a list of rows.
  /// \return INVALID_ARG if the rows are not all the same length.
  static Status FromRows(
      const std::vector<std::vector<double>>& rows, Matrix* matrix);

  size_t Rows() const { return rows_; }
  size_t Cols() const { return cols_; }
  bool Empty() const { return data_.empty(); }

  double& At(const size_t row, const size_t col)
  {
    return data_[row * cols_ + col];
  }
  double At(const size_t row, const size_t col) const
  {
    return data_[row * cols_ + col];
  }

  // Pointer to the first element of a row.
  const double* Row(const size_t row) const
  {
    return data_.data() + row * cols_;
  }
  double* MutableRow(const size_t row) { return data_.data() + row * cols_; }

  const std::vector<double>& Data() const { return data_; }

  std::vector<double> RowVector(const size_t row) const;

  bool operator==(const Matrix& other) const
  {
    return (rows_ == other.rows_) && (cols_ == other.cols_) &&
           (data_ == other.data_);
  }
  bool operator!=(const Matrix& other) const { return !(*this == other); }

 private:
  size_t rows_;
  size_t cols_;
  std::vector<double> data_;
};

//
// Column oriented table of named numeric columns, all of the same
// length.
//
class Table {
 public:
  /// Add a column.
  /// \return INVALID_ARG if the name is taken or the length differs
  /// from the columns already added.
  Status AddColumn(const std::string& name, const std::vector<double>& values);

  size_t Rows() const { return rows_; }
  size_t Cols() const { return columns_.size(); }
  bool HasColumn(const std::string& name) const;

  /// Convert to a matrix with the columns in the given order.
  /// \param column_names The column order. If empty, the order in
  /// which the columns were added is used.
  /// \param matrix Returns the matrix.
  /// \return NOT_FOUND if a named column is missing.
  Status ToMatrix(
      const std::vector<std::string>& column_names, Matrix* matrix) const;

 private:
  size_t rows_ = 0;
  std::vector<std::string> order_;
  std::map<std::string, std::vector<double>> columns_;
};

/// Parse a CSV batch, one sample per line. Blank lines are skipped. A
/// leading line that is not numeric is taken as the column names.
/// \param contents The CSV text.
/// \param source Name of the input, used in error messages.
/// \param header Returns the column names, empty if there are none.
/// \param rows Returns the samples.
/// \return INVALID_ARG if a line holds an empty or non-numeric field,
/// or if there are no samples.
Status ParseCsvBatch(
    const std::string& contents, const std::string& source,
    std::vector<std::string>* header, std::vector<std::vector<double>>* rows);

/// Read a CSV batch from a file. See ParseCsvBatch.
Status ReadCsvBatch(
    const std::string& path, std::vector<std::string>* header,
    std::vector<std::vector<double>>* rows);

}  // namespace modelrunner
