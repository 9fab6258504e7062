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

#include "src/backends/predictor/artifact_codec.h"

#include "src/backends/predictor/linear_model.h"
#include "src/backends/predictor/tree_ensemble.h"
#include "src/core/filesystem.h"
#include "src/core/logging.h"

namespace modelrunner {

std::string
ProtoArtifactCodec::ArtifactPath(const std::string& dir)
{
  return JoinPath({dir, std::string(kSaveNamespace) + kModelExt});
}

std::vector<std::string>
ProtoArtifactCodec::SupportedFamilies() const
{
  return {kLinearFamily, kTreeEnsembleFamily};
}

Status
ProtoArtifactCodec::Dump(const Predictor& predictor, const std::string& dir)
{
  if ((predictor.Family() != kLinearFamily) &&
      (predictor.Family() != kTreeEnsembleFamily)) {
    return Status(
        Status::Code::UNSUPPORTED,
        "cannot write predictor of unknown family '" + predictor.Family() +
            "'");
  }

  proto::PredictorArtifact artifact;
  RETURN_IF_ERROR(predictor.ToArtifact(&artifact));
  artifact.set_format_version(kArtifactFormatVersion);

  const std::string path = ArtifactPath(dir);
  RETURN_IF_ERROR(WriteBinaryProto(path, artifact));

  LOG_VERBOSE(1) << "wrote " << predictor.Family() << " predictor to "
                 << path;
  return Status::Success;
}

Status
ProtoArtifactCodec::Load(
    const std::string& dir, std::unique_ptr<Predictor>* predictor)
{
  const std::string path = ArtifactPath(dir);

  bool exists;
  RETURN_IF_ERROR(FileExists(path, &exists));
  if (!exists) {
    return Status(
        Status::Code::CORRUPT, "model artifact '" + path + "' is missing");
  }

  proto::PredictorArtifact artifact;
  Status status = ReadBinaryProto(path, &artifact);
  if (!status.IsOk()) {
    return Status(
        Status::Code::CORRUPT,
        "model artifact '" + path + "' is unreadable: " + status.Message());
  }

  if ((artifact.format_version() == 0) ||
      (artifact.format_version() > kArtifactFormatVersion)) {
    return Status(
        Status::Code::CORRUPT,
        "model artifact '" + path + "' has format version " +
            std::to_string(artifact.format_version()) +
            ", this build reads up to version " +
            std::to_string(kArtifactFormatVersion));
  }

  status = CreatePredictor(artifact, predictor);
  if (!status.IsOk()) {
    return Status(
        Status::Code::CORRUPT,
        "model artifact '" + path + "' is invalid: " + status.Message());
  }

  LOG_VERBOSE(1) << "loaded " << (*predictor)->Family() << " predictor from "
                 << path;
  return Status::Success;
}

Status
ProtoArtifactCodec::CreatePredictor(
    const proto::PredictorArtifact& artifact,
    std::unique_ptr<Predictor>* predictor)
{
  const std::vector<std::string> feature_names(
      artifact.feature_names().begin(), artifact.feature_names().end());

  switch (artifact.model_case()) {
    case proto::PredictorArtifact::kLinear: {
      std::unique_ptr<LinearModel> model;
      RETURN_IF_ERROR(
          LinearModel::Create(artifact.linear(), feature_names, &model));
      predictor->reset(model.release());
      return Status::Success;
    }
    case proto::PredictorArtifact::kTreeEnsemble: {
      std::unique_ptr<TreeEnsemble> model;
      RETURN_IF_ERROR(TreeEnsemble::Create(
          artifact.tree_ensemble(), feature_names, &model));
      predictor->reset(model.release());
      return Status::Success;
    }
    default:
      break;
  }

  return Status(
      Status::Code::UNSUPPORTED, "artifact holds no known predictor family");
}

}  // namespace modelrunner
