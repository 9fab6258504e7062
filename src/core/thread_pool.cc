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

#include "src/core/thread_pool.h"

#include <algorithm>
#include <string>
#include <system_error>

namespace modelrunner {

//
// WorkerPool
//
Status
WorkerPool::Create(const size_t worker_count, std::unique_ptr<WorkerPool>* pool)
{
  if (worker_count < 1) {
    return Status(
        Status::Code::INVALID_ARG,
        "worker pool must be created with positive 'worker_count'");
  }

  std::unique_ptr<WorkerPool> local_pool(new WorkerPool());
  WorkerPool* raw = local_pool.get();
  for (size_t cnt = 0; cnt < worker_count; cnt++) {
    try {
      local_pool->worker_threads_.push_back(std::unique_ptr<std::thread>(
          new std::thread([raw] { raw->WorkThread(); })));
    }
    catch (const std::system_error& ex) {
      // Workers already started are stopped and joined by the destructor.
      return Status(
          Status::Code::INTERNAL, "failed to start worker " +
                                      std::to_string(cnt) + " of " +
                                      std::to_string(worker_count) + ": " +
                                      ex.what());
    }
  }

  *pool = std::move(local_pool);
  return Status::Success;
}

WorkerPool::~WorkerPool()
{
  for (size_t cnt = 0; cnt < worker_threads_.size(); cnt++) {
    task_queue_.Put(nullptr);
  }
  for (const auto& worker_thread : worker_threads_) {
    worker_thread->join();
  }
}

void
WorkerPool::AddTask(std::function<void(void)>&& task)
{
  task_queue_.Put(std::move(task));
}

void
WorkerPool::WorkThread()
{
  while (true) {
    auto task = task_queue_.Get();
    if (task != nullptr) {
      task();
    } else {
      break;
    }
  }
}

//
// ParallelScope
//
ParallelScope::ParallelScope(WorkerPool* pool, const size_t max_workers)
    : pool_(pool), max_workers_(std::max<size_t>(1, max_workers)), pending_(0)
{
}

ParallelScope::~ParallelScope()
{
  WaitForPending();
}

void
ParallelScope::WaitForPending()
{
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return pending_ == 0; });
}

Status
ParallelScope::ParallelFor(
    const size_t count,
    const std::function<Status(size_t begin, size_t end)>& fn)
{
  if (count == 0) {
    return Status::Success;
  }

  const size_t chunk_count = std::min(count, max_workers_);
  if ((pool_ == nullptr) || (chunk_count == 1)) {
    return fn(0, count);
  }

  // Spread the remainder over the leading chunks so chunk sizes differ
  // by at most one.
  const size_t base = count / chunk_count;
  const size_t remainder = count % chunk_count;

  std::vector<Status> statuses(chunk_count);
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_ += chunk_count;
  }

  size_t begin = 0;
  for (size_t chunk = 0; chunk < chunk_count; ++chunk) {
    const size_t end = begin + base + ((chunk < remainder) ? 1 : 0);
    pool_->AddTask([this, &fn, &statuses, chunk, begin, end] {
      statuses[chunk] = fn(begin, end);
      // Notify with the lock held, the scope may be destroyed as soon
      // as the waiter observes the last completion.
      std::lock_guard<std::mutex> lk(mu_);
      pending_--;
      cv_.notify_all();
    });
    begin = end;
  }

  WaitForPending();

  for (const auto& status : statuses) {
    RETURN_IF_ERROR(status);
  }
  return Status::Success;
}

}  // namespace modelrunner
