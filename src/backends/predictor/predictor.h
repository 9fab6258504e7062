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

#include <string>
#include <vector>
#include "predictor_artifact.pb.h"
#include "src/core/constants.h"
#include "src/core/matrix.h"
#include "src/core/status.h"
#include "src/core/thread_pool.h"

namespace modelrunner {

//
// A trained CPU model mapping samples (rows of features) to
// predictions. A predictor is immutable once created, so one instance
// can serve concurrent Predict() calls.
//
class Predictor {
 public:
  virtual ~Predictor() {}

  // The family of the model, e.g. "linear".
  virtual const std::string& Family() const = 0;

  // Number of features each input sample must have.
  size_t NumFeatures() const { return num_features_; }

  // Number of columns of a prediction.
  virtual size_t NumOutputs() const = 0;

  // Names of the features in input column order, empty if the model
  // was trained without named features.
  const std::vector<std::string>& FeatureNames() const
  {
    return feature_names_;
  }

  /// Predict a batch of samples.
  /// \param input The samples, one per row, NumFeatures() columns.
  /// \param scope The concurrency context bounding the workers the
  /// prediction may use, or nullptr to predict on the calling thread.
  /// \param output Returns the predictions, one row per input row.
  /// \return INVALID_ARG if the input does not have NumFeatures()
  /// columns.
  Status Predict(
      const Matrix& input, ParallelScope* scope, Matrix* output) const;

  /// Describe the predictor as a serializable artifact. The format
  /// version is left to the codec writing the artifact.
  Status ToArtifact(proto::PredictorArtifact* artifact) const;

 protected:
  Predictor(
      const size_t num_features, const std::vector<std::string>& feature_names)
      : num_features_(num_features), feature_names_(feature_names)
  {
  }

  // Check that 'feature_names' is empty or names every feature
  // exactly once.
  static Status ValidateFeatureNames(
      const size_t num_features,
      const std::vector<std::string>& feature_names);

  // Predict rows [begin, end) of 'input' into the same rows of
  // 'output'. 'output' is already sized. Called concurrently for
  // disjoint ranges.
  virtual void PredictRows(
      const Matrix& input, const size_t begin, const size_t end,
      Matrix* output) const = 0;

  // Write the family specific part of the artifact.
  virtual void ExportModel(proto::PredictorArtifact* artifact) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Predictor);

  const size_t num_features_;
  const std::vector<std::string> feature_names_;
};

}  // namespace modelrunner
