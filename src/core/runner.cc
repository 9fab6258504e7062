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

#include "src/core/runner.h"

#include <utility>
#include "src/core/logging.h"

namespace modelrunner {

const std::string&
ReplicaStateString(ReplicaState state)
{
  switch (state) {
    case ReplicaState::UNINITIALIZED: {
      static std::string m("UNINITIALIZED");
      return m;
    }
    case ReplicaState::LOADING: {
      static std::string m("LOADING");
      return m;
    }
    case ReplicaState::READY: {
      static std::string m("READY");
      return m;
    }
    case ReplicaState::FAILED: {
      static std::string m("FAILED");
      return m;
    }
  }

  static std::string m("<unknown>");
  return m;
}

Runner::Runner(
    const std::string& tag, const proto::ResourceQuota& quota,
    const proto::BatchOptions& options)
    : tag_(tag), quota_(quota), options_(options), num_replica_(0),
      num_concurrency_per_replica_(0)
{
}

Runner::~Runner() {}

Status
Runner::Init()
{
  if (!replicas_.empty()) {
    return Status(
        Status::Code::INTERNAL,
        "runner for '" + tag_ + "' is already initialized");
  }

  num_replica_ = ComputeNumReplica(quota_);
  num_concurrency_per_replica_ = ComputeNumConcurrencyPerReplica(quota_);
  if (num_replica_ == 0) {
    return Status(
        Status::Code::INVALID_ARG,
        "resource quota leaves no replica for runner of '" + tag_ + "'");
  }

  for (size_t id = 0; id < num_replica_; ++id) {
    replicas_.emplace_back(new ReplicaSlot());
  }

  LOG_INFO << "created runner for '" << tag_ << "' with " << num_replica_
           << " replica(s), " << num_concurrency_per_replica_
           << " worker(s) per replica";
  return Status::Success;
}

ReplicaState
Runner::State(const size_t replica_id) const
{
  if (replica_id >= replicas_.size()) {
    return ReplicaState::UNINITIALIZED;
  }
  return replicas_[replica_id]->state_.load();
}

Status
Runner::ReadyReplica(const size_t replica_id, ReplicaContext** context)
{
  if (replica_id >= replicas_.size()) {
    return Status(
        Status::Code::INVALID_ARG,
        "unexpected replica id " + std::to_string(replica_id) +
            " for runner of '" + tag_ + "', " +
            std::to_string(replicas_.size()) + " replica(s) available");
  }

  ReplicaSlot* slot = replicas_[replica_id].get();
  std::call_once(slot->setup_once_, [this, slot, replica_id] {
    slot->state_ = ReplicaState::LOADING;
    LOG_VERBOSE(1) << "setting up replica " << replica_id << " of '" << tag_
                   << "'";

    Status status = Setup(replica_id, &slot->context_);
    if (status.IsOk() && (slot->context_ == nullptr)) {
      status = Status(
          Status::Code::INTERNAL, "setup of replica " +
                                      std::to_string(replica_id) +
                                      " produced no model state");
    }

    slot->setup_status_ = status;
    if (status.IsOk()) {
      slot->state_ = ReplicaState::READY;
      LOG_INFO << "replica " << replica_id << " of '" << tag_ << "' is ready";
    } else {
      slot->context_.reset();
      slot->state_ = ReplicaState::FAILED;
      LOG_ERROR << "replica " << replica_id << " of '" << tag_
                << "' failed to set up: " << status.AsString();
    }
  });

  // The setup status is only written inside call_once, which every
  // caller returning from call_once is synchronized with.
  RETURN_IF_ERROR(slot->setup_status_);

  *context = slot->context_.get();
  return Status::Success;
}

Status
Runner::RunBatch(const Matrix& input, Matrix* output, const size_t replica_id)
{
  if (input.Rows() == 0) {
    return Status(
        Status::Code::INVALID_ARG,
        "batch for '" + tag_ + "' must contain at least one sample");
  }

  ReplicaContext* context;
  RETURN_IF_ERROR(ReadyReplica(replica_id, &context));

  Matrix result;
  RETURN_IF_ERROR(RunBatchImpl(context, input, &result));
  if (result.Rows() != input.Rows()) {
    return Status(
        Status::Code::INTERNAL,
        "runner for '" + tag_ + "' produced " +
            std::to_string(result.Rows()) + " output rows for " +
            std::to_string(input.Rows()) + " input rows");
  }

  LOG_VERBOSE(1) << "replica " << replica_id << " of '" << tag_
                 << "' executed batch of " << input.Rows() << " sample(s)";

  *output = std::move(result);
  return Status::Success;
}

Status
Runner::RunBatch(const Table& input, Matrix* output, const size_t replica_id)
{
  ReplicaContext* context;
  RETURN_IF_ERROR(ReadyReplica(replica_id, &context));

  Matrix matrix;
  RETURN_IF_ERROR_WITH_PREFIX(
      input.ToMatrix(InputNames(context), &matrix),
      "tabular batch for '" + tag_ + "' does not match the model inputs");

  return RunBatch(matrix, output, replica_id);
}

Status
Runner::Run(
    const std::vector<double>& sample, std::vector<double>* output,
    const size_t replica_id)
{
  Matrix input;
  RETURN_IF_ERROR(Matrix::FromRows({sample}, &input));

  Matrix result;
  RETURN_IF_ERROR(RunBatch(input, &result, replica_id));

  *output = result.RowVector(0);
  return Status::Success;
}

}  // namespace modelrunner
