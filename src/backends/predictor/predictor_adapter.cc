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

#include "src/backends/predictor/predictor_adapter.h"

#include <algorithm>
#include "src/core/logging.h"
#include "src/core/runner_config_utils.h"

namespace modelrunner {

Status
PredictorAdapter::Create(
    ModelStore* store, const std::shared_ptr<ArtifactCodec>& codec,
    std::unique_ptr<PredictorAdapter>* adapter)
{
  if (store == nullptr) {
    return Status(
        Status::Code::MISSING_DEPENDENCY,
        "predictor adapter requires a model store");
  }
  if (codec == nullptr) {
    return Status(
        Status::Code::MISSING_DEPENDENCY,
        "predictor adapter requires an artifact codec");
  }
  if (codec->SupportedFamilies().empty()) {
    return Status(
        Status::Code::MISSING_DEPENDENCY,
        "artifact codec supports no predictor family");
  }

  adapter->reset(new PredictorAdapter(store, codec));
  return Status::Success;
}

const std::string&
PredictorAdapter::Module()
{
  static const std::string module(kPredictorModule);
  return module;
}

Status
PredictorAdapter::Save(
    const std::string& name, const Predictor& predictor,
    const ModelMetadata& metadata, std::string* tag)
{
  const std::vector<std::string> families = codec_->SupportedFamilies();
  if (std::find(families.begin(), families.end(), predictor.Family()) ==
      families.end()) {
    return Status(
        Status::Code::UNSUPPORTED, "artifact codec cannot save " +
                                       predictor.Family() + " predictors");
  }

  const FrameworkContext framework_context{
      {"modelrunner", MODELRUNNER_VERSION},
      {"artifact_format", std::to_string(kArtifactFormatVersion)},
      {"predictor_family", predictor.Family()}};

  std::unique_ptr<ModelRegistration> registration;
  RETURN_IF_ERROR(store_->Register(
      name, Module(), metadata, framework_context, &registration));

  // Returning early destroys the registration, which removes
  // everything written so far.
  RETURN_IF_ERROR_WITH_PREFIX(
      codec_->Dump(predictor, registration->Path()),
      "failed to save '" + registration->Tag() + "'");
  RETURN_IF_ERROR(registration->Commit());

  *tag = registration->Tag();
  return Status::Success;
}

Status
PredictorAdapter::GetModelInfo(const std::string& tag, proto::ModelInfo* info)
{
  RETURN_IF_ERROR(store_->Get(tag, info));
  if (info->module() != Module()) {
    return Status(
        Status::Code::MODULE_MISMATCH,
        "model '" + info->tag() + "' was saved by module '" + info->module() +
            "', not by '" + Module() + "'");
  }

  return Status::Success;
}

Status
PredictorAdapter::Load(
    const std::string& tag, std::unique_ptr<Predictor>* predictor)
{
  proto::ModelInfo info;
  RETURN_IF_ERROR(GetModelInfo(tag, &info));
  RETURN_IF_ERROR(codec_->Load(info.path(), predictor));

  LOG_VERBOSE(1) << "loaded predictor '" << info.tag() << "'";
  return Status::Success;
}

Status
PredictorAdapter::LoadRunner(
    const std::string& tag, const proto::ResourceQuota* quota,
    const proto::BatchOptions* options,
    std::unique_ptr<PredictorRunner>* runner)
{
  proto::ResourceQuota runner_quota;
  if (quota == nullptr) {
    DefaultResourceQuota(&runner_quota);
  } else {
    RETURN_IF_ERROR(ValidateResourceQuota(*quota));
    runner_quota = *quota;
  }

  proto::BatchOptions runner_options;
  if (options == nullptr) {
    DefaultBatchOptions(&runner_options);
  } else {
    RETURN_IF_ERROR(ValidateBatchOptions(*options));
    runner_options = *options;
  }

  proto::ModelInfo info;
  RETURN_IF_ERROR(GetModelInfo(tag, &info));

  return PredictorRunner::Create(
      info, runner_quota, runner_options, codec_, runner);
}

}  // namespace modelrunner
