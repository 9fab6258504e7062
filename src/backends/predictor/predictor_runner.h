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
#include "model_info.pb.h"
#include "src/backends/predictor/artifact_codec.h"
#include "src/core/runner.h"
#include "src/core/thread_pool.h"

namespace modelrunner {

//
// Runner serving a CPU predictor. The model is not replicated; every
// batch runs on replica 0 and may use up to round(cpu) workers of the
// replica's pool. The artifact is read the first time the replica is
// used.
//
class PredictorRunner : public Runner {
 public:
  /// Create a runner for a resolved model version. Nothing is read
  /// from the model directory until the first batch.
  /// \param info The resolved model information, 'path' must be set.
  /// \param quota The resource quota, already validated.
  /// \param options The batch options.
  /// \param codec The codec used to read the artifact.
  /// \param runner Returns the runner.
  /// \return The error status.
  static Status Create(
      const proto::ModelInfo& info, const proto::ResourceQuota& quota,
      const proto::BatchOptions& options,
      const std::shared_ptr<ArtifactCodec>& codec,
      std::unique_ptr<PredictorRunner>* runner);

  const proto::ModelInfo& Info() const { return info_; }

  std::vector<std::string> RequiredModels() const override;

 protected:
  size_t ComputeNumReplica(const proto::ResourceQuota& quota) const override;
  size_t ComputeNumConcurrencyPerReplica(
      const proto::ResourceQuota& quota) const override;

  Status Setup(
      const size_t replica_id,
      std::unique_ptr<ReplicaContext>* context) override;
  Status RunBatchImpl(
      ReplicaContext* context, const Matrix& input, Matrix* output) override;
  std::vector<std::string> InputNames(ReplicaContext* context) const override;

 private:
  struct Context : public ReplicaContext {
    std::unique_ptr<Predictor> predictor_;

    // nullptr when the worker budget is a single worker.
    std::unique_ptr<WorkerPool> pool_;
  };

  PredictorRunner(
      const proto::ModelInfo& info, const proto::ResourceQuota& quota,
      const proto::BatchOptions& options,
      const std::shared_ptr<ArtifactCodec>& codec);

  const proto::ModelInfo info_;
  const std::shared_ptr<ArtifactCodec> codec_;
};

}  // namespace modelrunner
