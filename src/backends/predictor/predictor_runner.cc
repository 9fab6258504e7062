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

#include "src/backends/predictor/predictor_runner.h"

#include <cmath>
#include <utility>
#include "src/core/logging.h"
#include "src/core/runner_config_utils.h"

namespace modelrunner {

Status
PredictorRunner::Create(
    const proto::ModelInfo& info, const proto::ResourceQuota& quota,
    const proto::BatchOptions& options,
    const std::shared_ptr<ArtifactCodec>& codec,
    std::unique_ptr<PredictorRunner>* runner)
{
  if (codec == nullptr) {
    return Status(
        Status::Code::MISSING_DEPENDENCY,
        "runner for '" + info.tag() + "' requires an artifact codec");
  }
  if (info.path().empty()) {
    return Status(
        Status::Code::INVALID_ARG,
        "runner for '" + info.tag() + "' requires a resolved model path");
  }
  RETURN_IF_ERROR_WITH_PREFIX(
      ValidateResourceQuota(quota), "runner for '" + info.tag() + "'");

  std::unique_ptr<PredictorRunner> local_runner(
      new PredictorRunner(info, quota, options, codec));
  RETURN_IF_ERROR(local_runner->Init());

  *runner = std::move(local_runner);
  return Status::Success;
}

PredictorRunner::PredictorRunner(
    const proto::ModelInfo& info, const proto::ResourceQuota& quota,
    const proto::BatchOptions& options,
    const std::shared_ptr<ArtifactCodec>& codec)
    : Runner(info.tag(), quota, options), info_(info), codec_(codec)
{
}

std::vector<std::string>
PredictorRunner::RequiredModels() const
{
  return {info_.tag()};
}

size_t
PredictorRunner::ComputeNumReplica(const proto::ResourceQuota& quota) const
{
  // CPU models are not bound to devices, GPU ids are ignored.
  return 1;
}

size_t
PredictorRunner::ComputeNumConcurrencyPerReplica(
    const proto::ResourceQuota& quota) const
{
  return static_cast<size_t>(std::lround(quota.cpu()));
}

Status
PredictorRunner::Setup(
    const size_t replica_id, std::unique_ptr<ReplicaContext>* context)
{
  std::unique_ptr<Context> local_context(new Context());
  RETURN_IF_ERROR(codec_->Load(info_.path(), &local_context->predictor_));

  const size_t worker_count = NumConcurrencyPerReplica();
  if (worker_count > 1) {
    RETURN_IF_ERROR(WorkerPool::Create(worker_count, &local_context->pool_));
  }

  LOG_VERBOSE(1) << "replica " << replica_id << " of '" << info_.tag()
                 << "' loaded " << local_context->predictor_->Family()
                 << " predictor with " << worker_count << " worker(s)";

  context->reset(local_context.release());
  return Status::Success;
}

Status
PredictorRunner::RunBatchImpl(
    ReplicaContext* context, const Matrix& input, Matrix* output)
{
  Context* ctx = static_cast<Context*>(context);
  ParallelScope scope(ctx->pool_.get(), NumConcurrencyPerReplica());
  return ctx->predictor_->Predict(input, &scope, output);
}

std::vector<std::string>
PredictorRunner::InputNames(ReplicaContext* context) const
{
  return static_cast<Context*>(context)->predictor_->FeatureNames();
}

}  // namespace modelrunner
