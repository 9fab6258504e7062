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

#include <memory>
#include "src/backends/predictor/predictor.h"

namespace modelrunner {

//
// Affine model. A regressor predicts 'num_targets' values per sample.
// A classifier predicts one class label per sample: the class of the
// highest score, or for a single score the second class when the score
// is positive and the first class otherwise.
//
class LinearModel : public Predictor {
 public:
  /// Create a linear model from its parameters.
  /// \param params The coefficients, intercepts and optional classes.
  /// \param feature_names The feature names, or empty.
  /// \param model Returns the model.
  /// \return INVALID_ARG if the parameter shapes are inconsistent.
  static Status Create(
      const proto::LinearModel& params,
      const std::vector<std::string>& feature_names,
      std::unique_ptr<LinearModel>* model);

  const std::string& Family() const override;
  size_t NumOutputs() const override;

  bool IsClassifier() const { return params_.classes_size() > 0; }
  const proto::LinearModel& Params() const { return params_; }

 protected:
  void PredictRows(
      const Matrix& input, const size_t begin, const size_t end,
      Matrix* output) const override;
  void ExportModel(proto::PredictorArtifact* artifact) const override;

 private:
  LinearModel(
      const proto::LinearModel& params,
      const std::vector<std::string>& feature_names);

  // Score of one target for one sample.
  double Score(const double* sample, const size_t target) const;

  const proto::LinearModel params_;
};

}  // namespace modelrunner
