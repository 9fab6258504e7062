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

#include "src/backends/predictor/linear_model.h"

namespace modelrunner {

Status
LinearModel::Create(
    const proto::LinearModel& params,
    const std::vector<std::string>& feature_names,
    std::unique_ptr<LinearModel>* model)
{
  const size_t num_features = params.num_features();
  const size_t num_targets = params.num_targets();
  if ((num_features == 0) || (num_targets == 0)) {
    return Status(
        Status::Code::INVALID_ARG,
        "linear model must have at least one feature and one target");
  }

  if (static_cast<size_t>(params.coef_size()) != num_features * num_targets) {
    return Status(
        Status::Code::INVALID_ARG,
        "linear model expects " + std::to_string(num_features * num_targets) +
            " coefficients, got " + std::to_string(params.coef_size()));
  }

  if ((params.intercept_size() != 0) &&
      (static_cast<size_t>(params.intercept_size()) != num_targets)) {
    return Status(
        Status::Code::INVALID_ARG,
        "linear model expects " + std::to_string(num_targets) +
            " intercepts, got " + std::to_string(params.intercept_size()));
  }

  const size_t num_classes = params.classes_size();
  if (num_classes != 0) {
    const bool binary = (num_targets == 1) && (num_classes == 2);
    const bool multiclass = (num_targets > 1) && (num_classes == num_targets);
    if (!binary && !multiclass) {
      return Status(
          Status::Code::INVALID_ARG,
          "linear classifier with " + std::to_string(num_targets) +
              " targets cannot predict " + std::to_string(num_classes) +
              " classes");
    }
  }

  RETURN_IF_ERROR(ValidateFeatureNames(num_features, feature_names));

  model->reset(new LinearModel(params, feature_names));
  return Status::Success;
}

LinearModel::LinearModel(
    const proto::LinearModel& params,
    const std::vector<std::string>& feature_names)
    : Predictor(params.num_features(), feature_names), params_(params)
{
}

const std::string&
LinearModel::Family() const
{
  static const std::string family(kLinearFamily);
  return family;
}

size_t
LinearModel::NumOutputs() const
{
  return IsClassifier() ? 1 : params_.num_targets();
}

double
LinearModel::Score(const double* sample, const size_t target) const
{
  const size_t num_features = params_.num_features();
  const double* coef = params_.coef().data() + target * num_features;

  double score =
      (params_.intercept_size() == 0) ? 0.0 : params_.intercept(target);
  for (size_t f = 0; f < num_features; ++f) {
    score += coef[f] * sample[f];
  }
  return score;
}

void
LinearModel::PredictRows(
    const Matrix& input, const size_t begin, const size_t end,
    Matrix* output) const
{
  const size_t num_targets = params_.num_targets();
  for (size_t row = begin; row < end; ++row) {
    const double* sample = input.Row(row);

    if (!IsClassifier()) {
      double* out = output->MutableRow(row);
      for (size_t t = 0; t < num_targets; ++t) {
        out[t] = Score(sample, t);
      }
    } else if (num_targets == 1) {
      output->At(row, 0) = params_.classes((Score(sample, 0) > 0) ? 1 : 0);
    } else {
      // Ties go to the first class.
      size_t best = 0;
      double best_score = Score(sample, 0);
      for (size_t t = 1; t < num_targets; ++t) {
        const double score = Score(sample, t);
        if (score > best_score) {
          best = t;
          best_score = score;
        }
      }
      output->At(row, 0) = params_.classes(best);
    }
  }
}

void
LinearModel::ExportModel(proto::PredictorArtifact* artifact) const
{
  *artifact->mutable_linear() = params_;
}

}  // namespace modelrunner
