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

#include "src/core/matrix.h"

#include <stdlib.h>
#include <algorithm>
#include <sstream>
#include <utility>
#include "src/core/filesystem.h"

namespace modelrunner {

Status
Matrix::FromRows(const std::vector<std::vector<double>>& rows, Matrix* matrix)
{
  const size_t cols = rows.empty() ? 0 : rows.front().size();
  Matrix result(rows.size(), cols);
  for (size_t r = 0; r < rows.size(); ++r) {
    if (rows[r].size() != cols) {
      return Status(
          Status::Code::INVALID_ARG,
          "row " + std::to_string(r) + " has " +
              std::to_string(rows[r].size()) + " values, expected " +
              std::to_string(cols));
    }
    std::copy(rows[r].begin(), rows[r].end(), result.MutableRow(r));
  }

  *matrix = std::move(result);
  return Status::Success;
}

std::vector<double>
Matrix::RowVector(const size_t row) const
{
  return std::vector<double>(Row(row), Row(row) + cols_);
}

Status
Table::AddColumn(const std::string& name, const std::vector<double>& values)
{
  if (columns_.find(name) != columns_.end()) {
    return Status(
        Status::Code::INVALID_ARG, "duplicate column '" + name + "'");
  }
  if (!columns_.empty() && (values.size() != rows_)) {
    return Status(
        Status::Code::INVALID_ARG,
        "column '" + name + "' has " + std::to_string(values.size()) +
            " rows, expected " + std::to_string(rows_));
  }

  rows_ = values.size();
  order_.push_back(name);
  columns_.emplace(name, values);
  return Status::Success;
}

bool
Table::HasColumn(const std::string& name) const
{
  return columns_.find(name) != columns_.end();
}

Status
Table::ToMatrix(
    const std::vector<std::string>& column_names, Matrix* matrix) const
{
  const std::vector<std::string>& names =
      column_names.empty() ? order_ : column_names;

  Matrix result(rows_, names.size());
  for (size_t c = 0; c < names.size(); ++c) {
    const auto itr = columns_.find(names[c]);
    if (itr == columns_.end()) {
      return Status(
          Status::Code::NOT_FOUND, "missing column '" + names[c] + "'");
    }
    for (size_t r = 0; r < rows_; ++r) {
      result.At(r, c) = itr->second[r];
    }
  }

  *matrix = std::move(result);
  return Status::Success;
}

namespace {

// Split a CSV line on ',', trimming blanks around each field. A line
// with N separators always yields N + 1 fields.
std::vector<std::string>
SplitCsvLine(const std::string& line)
{
  std::vector<std::string> fields;
  size_t begin = 0;
  while (true) {
    const size_t end = line.find(',', begin);
    const std::string field = line.substr(
        begin, (end == std::string::npos) ? std::string::npos : end - begin);
    const size_t first = field.find_first_not_of(" \t\r");
    const size_t last = field.find_last_not_of(" \t\r");
    fields.push_back(
        (first == std::string::npos) ? std::string()
                                     : field.substr(first, last - first + 1));
    if (end == std::string::npos) {
      break;
    }
    begin = end + 1;
  }
  return fields;
}

bool
ParseDouble(const std::string& str, double* value)
{
  if (str.empty()) {
    return false;
  }
  char* end;
  *value = strtod(str.c_str(), &end);
  return *end == '\0';
}

}  // namespace

Status
ParseCsvBatch(
    const std::string& contents, const std::string& source,
    std::vector<std::string>* header, std::vector<std::vector<double>>* rows)
{
  std::stringstream ss(contents);
  std::string line;
  size_t line_no = 0;
  while (std::getline(ss, line)) {
    line_no++;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    const std::vector<std::string> fields = SplitCsvLine(line);
    std::vector<double> row;
    for (const auto& field : fields) {
      double value;
      if (!ParseDouble(field, &value)) {
        break;
      }
      row.push_back(value);
    }

    if (row.size() != fields.size()) {
      const bool named = std::none_of(
          fields.begin(), fields.end(),
          [](const std::string& field) { return field.empty(); });
      if (named && header->empty() && rows->empty()) {
        *header = fields;
        continue;
      }
      return Status(
          Status::Code::INVALID_ARG,
          source + ":" + std::to_string(line_no) + ": expected numbers");
    }
    rows->push_back(std::move(row));
  }

  if (rows->empty()) {
    return Status(Status::Code::INVALID_ARG, source + " holds no samples");
  }
  return Status::Success;
}

Status
ReadCsvBatch(
    const std::string& path, std::vector<std::string>* header,
    std::vector<std::vector<double>>* rows)
{
  std::string contents;
  RETURN_IF_ERROR(ReadTextFile(path, &contents));
  return ParseCsvBatch(contents, path, header, rows);
}

}  // namespace modelrunner
