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
#include <string>
#include "src/backends/predictor/artifact_codec.h"
#include "src/backends/predictor/predictor_runner.h"
#include "src/core/model_store.h"

namespace modelrunner {

//
// Saves predictors into a model store and loads them back, either as a
// predictor or as a runner serving the predictor.
//
class PredictorAdapter {
 public:
  /// Create an adapter.
  /// \param store The model store. Must outlive the adapter.
  /// \param codec The codec reading and writing artifacts.
  /// \param adapter Returns the adapter.
  /// \return MISSING_DEPENDENCY if the store or codec is missing or
  /// the codec supports no predictor family.
  static Status Create(
      ModelStore* store, const std::shared_ptr<ArtifactCodec>& codec,
      std::unique_ptr<PredictorAdapter>* adapter);

  // The module recorded with every model the adapter saves.
  static const std::string& Module();

  /// Save a predictor as a new version of a model.
  /// \param name The model name.
  /// \param predictor The predictor to save.
  /// \param metadata User metadata stored with the version.
  /// \param tag Returns the tag of the new version.
  /// \return The error status. On error no version is published.
  Status Save(
      const std::string& name, const Predictor& predictor,
      const ModelMetadata& metadata, std::string* tag);

  /// Load the predictor of a stored model version.
  /// \param tag The tag of the version.
  /// \param predictor Returns the predictor.
  /// \return NOT_FOUND if the tag is unknown, MODULE_MISMATCH if the
  /// version was saved by another module, CORRUPT if the artifact
  /// cannot be read.
  Status Load(const std::string& tag, std::unique_ptr<Predictor>* predictor);

  /// Create a runner for a stored model version. The tag is resolved
  /// immediately, the artifact is only read on the first batch.
  /// \param tag The tag of the version.
  /// \param quota The resource quota, or nullptr for every hardware
  /// thread of the host.
  /// \param options The batch options, or nullptr for the defaults.
  /// \param runner Returns the runner.
  /// \return NOT_FOUND if the tag is unknown, MODULE_MISMATCH if the
  /// version was saved by another module, INVALID_ARG if the quota or
  /// batch options are malformed.
  Status LoadRunner(
      const std::string& tag, const proto::ResourceQuota* quota,
      const proto::BatchOptions* options,
      std::unique_ptr<PredictorRunner>* runner);

 private:
  DISALLOW_COPY_AND_ASSIGN(PredictorAdapter);

  PredictorAdapter(
      ModelStore* store, const std::shared_ptr<ArtifactCodec>& codec)
      : store_(store), codec_(codec)
  {
  }

  // Resolve a tag to a version saved by this adapter.
  Status GetModelInfo(const std::string& tag, proto::ModelInfo* info);

  ModelStore* store_;
  const std::shared_ptr<ArtifactCodec> codec_;
};

}  // namespace modelrunner
