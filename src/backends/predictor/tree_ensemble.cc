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

#include "src/backends/predictor/tree_ensemble.h"

#include <algorithm>
#include <vector>

namespace modelrunner {

Status
TreeEnsemble::ValidateTree(
    const proto::DecisionTree& tree, const size_t num_features,
    const size_t value_width)
{
  const int num_nodes = tree.left_child_size();
  if (num_nodes == 0) {
    return Status(Status::Code::INVALID_ARG, "decision tree has no nodes");
  }
  if ((tree.right_child_size() != num_nodes) ||
      (tree.feature_size() != num_nodes) ||
      (tree.threshold_size() != num_nodes)) {
    return Status(
        Status::Code::INVALID_ARG,
        "decision tree node arrays must all have " +
            std::to_string(num_nodes) + " entries");
  }
  if (static_cast<size_t>(tree.value_size()) != num_nodes * value_width) {
    return Status(
        Status::Code::INVALID_ARG,
        "decision tree expects " + std::to_string(num_nodes * value_width) +
            " leaf values, got " + std::to_string(tree.value_size()));
  }

  for (int node = 0; node < num_nodes; ++node) {
    const int left = tree.left_child(node);
    const int right = tree.right_child(node);
    if (left == -1) {
      if (right != -1) {
        return Status(
            Status::Code::INVALID_ARG,
            "decision tree node " + std::to_string(node) +
                " has only one child");
      }
      continue;
    }

    // Children always follow their parent, which rules out cycles.
    if ((left <= node) || (left >= num_nodes) || (right <= node) ||
        (right >= num_nodes)) {
      return Status(
          Status::Code::INVALID_ARG,
          "decision tree node " + std::to_string(node) +
              " has an out of range child");
    }
    if ((tree.feature(node) < 0) ||
        (static_cast<size_t>(tree.feature(node)) >= num_features)) {
      return Status(
          Status::Code::INVALID_ARG,
          "decision tree node " + std::to_string(node) + " splits on feature " +
              std::to_string(tree.feature(node)) + " of " +
              std::to_string(num_features));
    }
  }

  return Status::Success;
}

Status
TreeEnsemble::Create(
    const proto::TreeEnsemble& params,
    const std::vector<std::string>& feature_names,
    std::unique_ptr<TreeEnsemble>* model)
{
  const size_t num_features = params.num_features();
  const size_t value_width = params.value_width();
  if ((num_features == 0) || (value_width == 0)) {
    return Status(
        Status::Code::INVALID_ARG,
        "tree ensemble must have at least one feature and one value");
  }
  if (params.trees_size() == 0) {
    return Status(Status::Code::INVALID_ARG, "tree ensemble has no trees");
  }
  if ((params.classes_size() != 0) &&
      (static_cast<size_t>(params.classes_size()) != value_width)) {
    return Status(
        Status::Code::INVALID_ARG,
        "tree ensemble classifier expects " + std::to_string(value_width) +
            " classes, got " + std::to_string(params.classes_size()));
  }

  for (int idx = 0; idx < params.trees_size(); ++idx) {
    RETURN_IF_ERROR_WITH_PREFIX(
        ValidateTree(params.trees(idx), num_features, value_width),
        "tree " + std::to_string(idx));
  }

  RETURN_IF_ERROR(ValidateFeatureNames(num_features, feature_names));

  model->reset(new TreeEnsemble(params, feature_names));
  return Status::Success;
}

TreeEnsemble::TreeEnsemble(
    const proto::TreeEnsemble& params,
    const std::vector<std::string>& feature_names)
    : Predictor(params.num_features(), feature_names), params_(params)
{
}

const std::string&
TreeEnsemble::Family() const
{
  static const std::string family(kTreeEnsembleFamily);
  return family;
}

size_t
TreeEnsemble::NumOutputs() const
{
  return IsClassifier() ? 1 : params_.value_width();
}

const double*
TreeEnsemble::Leaf(const proto::DecisionTree& tree, const double* sample) const
{
  int node = 0;
  while (tree.left_child(node) != -1) {
    node = (sample[tree.feature(node)] <= tree.threshold(node))
               ? tree.left_child(node)
               : tree.right_child(node);
  }
  return tree.value().data() + node * params_.value_width();
}

void
TreeEnsemble::PredictRows(
    const Matrix& input, const size_t begin, const size_t end,
    Matrix* output) const
{
  const size_t value_width = params_.value_width();
  const double num_trees = params_.trees_size();

  std::vector<double> acc(value_width);
  for (size_t row = begin; row < end; ++row) {
    const double* sample = input.Row(row);
    std::fill(acc.begin(), acc.end(), 0.0);

    for (const auto& tree : params_.trees()) {
      const double* leaf = Leaf(tree, sample);
      if (!IsClassifier()) {
        for (size_t v = 0; v < value_width; ++v) {
          acc[v] += leaf[v];
        }
        continue;
      }

      double total = 0.0;
      for (size_t v = 0; v < value_width; ++v) {
        total += leaf[v];
      }
      if (total > 0) {
        for (size_t v = 0; v < value_width; ++v) {
          acc[v] += leaf[v] / total;
        }
      }
    }

    if (!IsClassifier()) {
      double* out = output->MutableRow(row);
      for (size_t v = 0; v < value_width; ++v) {
        out[v] = acc[v] / num_trees;
      }
    } else {
      // Ties go to the first class.
      size_t best = 0;
      for (size_t v = 1; v < value_width; ++v) {
        if (acc[v] > acc[best]) {
          best = v;
        }
      }
      output->At(row, 0) = params_.classes(best);
    }
  }
}

void
TreeEnsemble::ExportModel(proto::PredictorArtifact* artifact) const
{
  *artifact->mutable_tree_ensemble() = params_;
}

}  // namespace modelrunner
