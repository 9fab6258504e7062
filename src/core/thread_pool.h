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

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "src/core/constants.h"
#include "src/core/status.h"
#include "src/core/sync_queue.h"

namespace modelrunner {

//
// Fixed set of worker threads executing tasks in submission order.
//
class WorkerPool {
 public:
  /// Create a pool.
  /// \param worker_count The number of worker threads, must be
  /// positive.
  /// \param pool Returns the pool.
  /// \return The error status.
  static Status Create(
      const size_t worker_count, std::unique_ptr<WorkerPool>* pool);

  // Finishes the queued tasks and joins the workers.
  ~WorkerPool();

  size_t WorkerCount() const { return worker_threads_.size(); }

  // Queue a task for execution by one of the workers.
  void AddTask(std::function<void(void)>&& task);

 private:
  DISALLOW_COPY_AND_ASSIGN(WorkerPool);
  WorkerPool() = default;

  void WorkThread();

  std::vector<std::unique_ptr<std::thread>> worker_threads_;
  SyncQueue<std::function<void(void)>> task_queue_;
};

//
// Bounded concurrency context for one call: work split through the
// scope uses at most 'max_workers' workers of the pool. The scope
// waits for all of its tasks before it is destroyed, so nothing it
// submitted outlives it.
//
class ParallelScope {
 public:
  // 'pool' may be nullptr, in which case all work runs on the calling
  // thread.
  ParallelScope(WorkerPool* pool, const size_t max_workers);
  ~ParallelScope();

  // The number of workers that work may be split across. Always at
  // least 1.
  size_t MaxWorkers() const { return max_workers_; }

  /// Split the range [0, count) into at most MaxWorkers() contiguous
  /// chunks and call 'fn(begin, end)' on each, concurrently when a
  /// pool is available. Blocks until every chunk has finished.
  /// \return The first non-OK status returned by a chunk, in chunk
  /// order.
  Status ParallelFor(
      const size_t count,
      const std::function<Status(size_t begin, size_t end)>& fn);

 private:
  DISALLOW_COPY_AND_ASSIGN(ParallelScope);

  void WaitForPending();

  WorkerPool* pool_;
  const size_t max_workers_;

  std::mutex mu_;
  std::condition_variable cv_;
  size_t pending_;
};

}  // namespace modelrunner
