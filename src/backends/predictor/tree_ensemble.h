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
// Averaging ensemble of binary decision trees. A sample goes to the
// left child of a node when its feature value is less than or equal to
// the node threshold.
//
// A regressor predicts the mean of the leaf values reached in each
// tree. A classifier normalizes the leaf weights of each tree into
// class probabilities, averages them over the trees and predicts the
// class of the highest probability.
//
class TreeEnsemble : public Predictor {
 public:
  /// Create a tree ensemble.
  /// \param params The trees and optional classes.
  /// \param feature_names The feature names, or empty.
  /// \param model Returns the model.
  /// \return INVALID_ARG if a tree is malformed.
  static Status Create(
      const proto::TreeEnsemble& params,
      const std::vector<std::string>& feature_names,
      std::unique_ptr<TreeEnsemble>* model);

  const std::string& Family() const override;
  size_t NumOutputs() const override;

  bool IsClassifier() const { return params_.classes_size() > 0; }
  size_t NumTrees() const { return params_.trees_size(); }
  const proto::TreeEnsemble& Params() const { return params_; }

 protected:
  void PredictRows(
      const Matrix& input, const size_t begin, const size_t end,
      Matrix* output) const override;
  void ExportModel(proto::PredictorArtifact* artifact) const override;

 private:
  TreeEnsemble(
      const proto::TreeEnsemble& params,
      const std::vector<std::string>& feature_names);

  static Status ValidateTree(
      const proto::DecisionTree& tree, const size_t num_features,
      const size_t value_width);

  // The leaf values a sample reaches in one tree.
  const double* Leaf(const proto::DecisionTree& tree, const double* sample)
      const;

  const proto::TreeEnsemble params_;
};

}  // namespace modelrunner
