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

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "runner_config.pb.h"
#include "src/core/constants.h"
#include "src/core/matrix.h"
#include "src/core/status.h"

namespace modelrunner {

/// Readiness of one replica of a runner.
enum class ReplicaState {
  // Setup has not been attempted yet.
  UNINITIALIZED,

  // Setup is running, the model artifact is being loaded.
  LOADING,

  // The replica holds a loaded model and serves batches.
  READY,

  // Setup failed. Every batch sent to the replica fails with the setup
  // error, the load is never retried.
  FAILED
};

/// Get the string representation for a ReplicaState
const std::string& ReplicaStateString(ReplicaState state);

//
// A unit of serving logic wrapping one stored model. The replica and
// concurrency plan is derived from the resource quota once, when the
// runner is created. Each replica loads its model state the first
// time it is used.
//
class Runner {
 public:
  virtual ~Runner();

  // The tag the runner was created for.
  const std::string& Tag() const { return tag_; }

  const proto::ResourceQuota& Quota() const { return quota_; }
  const proto::BatchOptions& Options() const { return options_; }

  // Number of independent replicas of the model.
  size_t NumReplica() const { return num_replica_; }

  // Number of workers an inference call on one replica may use.
  size_t NumConcurrencyPerReplica() const
  {
    return num_concurrency_per_replica_;
  }

  // The tags of the stored models this runner depends on.
  virtual std::vector<std::string> RequiredModels() const = 0;

  /// Run inference for a batch of samples on a replica, setting the
  /// replica up first if needed.
  /// \param input The samples, one per row. Must not be empty.
  /// \param output Returns the predictions, one row per input row in
  /// input order.
  /// \param replica_id The replica to execute on.
  /// \return The error status.
  Status RunBatch(
      const Matrix& input, Matrix* output, const size_t replica_id = 0);

  /// Run inference for a tabular batch. Columns are matched to the
  /// model inputs by name when the model records its feature names,
  /// otherwise they are used in insertion order.
  Status RunBatch(
      const Table& input, Matrix* output, const size_t replica_id = 0);

  /// Run inference for a single sample.
  Status Run(
      const std::vector<double>& sample, std::vector<double>* output,
      const size_t replica_id = 0);

  /// \return the state of a replica, UNINITIALIZED for an out of
  /// range id.
  ReplicaState State(const size_t replica_id) const;

 protected:
  // Per-replica model state created by Setup().
  class ReplicaContext {
   public:
    virtual ~ReplicaContext() {}
  };

  Runner(
      const std::string& tag, const proto::ResourceQuota& quota,
      const proto::BatchOptions& options);

  // Compute the replica plan from the quota and allocate the replica
  // slots. Called exactly once by the factory of the derived runner.
  Status Init();

  virtual size_t ComputeNumReplica(
      const proto::ResourceQuota& quota) const = 0;
  virtual size_t ComputeNumConcurrencyPerReplica(
      const proto::ResourceQuota& quota) const = 0;

  // Load the model state of a replica. Called at most once per
  // replica.
  virtual Status Setup(
      const size_t replica_id, std::unique_ptr<ReplicaContext>* context) = 0;

  // Execute a non-empty batch on a replica that completed Setup().
  virtual Status RunBatchImpl(
      ReplicaContext* context, const Matrix& input, Matrix* output) = 0;

  // Names of the model inputs in the order the model expects them, or
  // empty if the model does not name its inputs.
  virtual std::vector<std::string> InputNames(ReplicaContext* context) const
  {
    return std::vector<std::string>();
  }

 private:
  DISALLOW_COPY_AND_ASSIGN(Runner);

  struct ReplicaSlot {
    ReplicaSlot() : state_(ReplicaState::UNINITIALIZED) {}

    std::once_flag setup_once_;
    std::atomic<ReplicaState> state_;
    Status setup_status_;
    std::unique_ptr<ReplicaContext> context_;
  };

  // Return the context of a replica, running its setup on first use.
  Status ReadyReplica(const size_t replica_id, ReplicaContext** context);

  const std::string tag_;
  const proto::ResourceQuota quota_;
  const proto::BatchOptions options_;

  size_t num_replica_;
  size_t num_concurrency_per_replica_;

  std::vector<std::unique_ptr<ReplicaSlot>> replicas_;
};

}  // namespace modelrunner
