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

#include "src/backends/predictor/predictor.h"

#include <set>
#include <utility>

namespace modelrunner {

Status
Predictor::ValidateFeatureNames(
    const size_t num_features, const std::vector<std::string>& feature_names)
{
  if (feature_names.empty()) {
    return Status::Success;
  }

  if (feature_names.size() != num_features) {
    return Status(
        Status::Code::INVALID_ARG,
        "expected " + std::to_string(num_features) + " feature names, got " +
            std::to_string(feature_names.size()));
  }

  std::set<std::string> seen;
  for (const auto& name : feature_names) {
    if (name.empty()) {
      return Status(
          Status::Code::INVALID_ARG, "feature names must not be empty");
    }
    if (!seen.insert(name).second) {
      return Status(
          Status::Code::INVALID_ARG, "duplicate feature name '" + name + "'");
    }
  }

  return Status::Success;
}

Status
Predictor::Predict(
    const Matrix& input, ParallelScope* scope, Matrix* output) const
{
  if (input.Cols() != num_features_) {
    return Status(
        Status::Code::INVALID_ARG,
        Family() + " predictor expects " + std::to_string(num_features_) +
            " features per sample, got " + std::to_string(input.Cols()));
  }

  Matrix result(input.Rows(), NumOutputs());
  if (scope == nullptr) {
    PredictRows(input, 0, input.Rows(), &result);
  } else {
    RETURN_IF_ERROR(scope->ParallelFor(
        input.Rows(),
        [this, &input, &result](size_t begin, size_t end) -> Status {
          PredictRows(input, begin, end, &result);
          return Status::Success;
        }));
  }

  *output = std::move(result);
  return Status::Success;
}

Status
Predictor::ToArtifact(proto::PredictorArtifact* artifact) const
{
  artifact->Clear();
  for (const auto& name : feature_names_) {
    artifact->add_feature_names(name);
  }
  ExportModel(artifact);
  return Status::Success;
}

}  // namespace modelrunner
