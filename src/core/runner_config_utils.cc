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

#include "src/core/runner_config_utils.h"

#include <cmath>
#include <string>
#include <thread>
#include "src/core/constants.h"
#include "src/core/filesystem.h"
#include "src/core/logging.h"

namespace modelrunner {

Status
ValidateResourceQuota(const proto::ResourceQuota& quota)
{
  if (!std::isfinite(quota.cpu()) || (quota.cpu() < 0)) {
    return Status(
        Status::Code::INVALID_ARG,
        "resource quota 'cpu' must be a non-negative number, got " +
            std::to_string(quota.cpu()));
  }
  if (quota.cpu() > kMaxResourceQuotaCpu) {
    return Status(
        Status::Code::INVALID_ARG,
        "resource quota 'cpu' must not exceed " +
            std::to_string(kMaxResourceQuotaCpu) + ", got " +
            std::to_string(quota.cpu()));
  }

  for (const auto gpu : quota.gpus()) {
    if (gpu < 0) {
      return Status(
          Status::Code::INVALID_ARG,
          "resource quota 'gpus' contains invalid device id " +
              std::to_string(gpu));
    }
  }

  return Status::Success;
}

Status
ValidateBatchOptions(const proto::BatchOptions& options)
{
  if (options.max_batch_size() < 0) {
    return Status(
        Status::Code::INVALID_ARG,
        "batch options 'max_batch_size' must be non-negative");
  }
  if (options.max_latency_ms() < 0) {
    return Status(
        Status::Code::INVALID_ARG,
        "batch options 'max_latency_ms' must be non-negative");
  }
  if ((options.input_batch_axis() < 0) || (options.output_batch_axis() < 0)) {
    return Status(
        Status::Code::INVALID_ARG, "batch options axes must be non-negative");
  }

  return Status::Success;
}

void
DefaultResourceQuota(proto::ResourceQuota* quota)
{
  const unsigned int hw_threads = std::thread::hardware_concurrency();
  if (hw_threads == 0) {
    LOG_WARNING << "unable to detect hardware concurrency, using 1 cpu";
  }
  quota->Clear();
  quota->set_cpu((hw_threads == 0) ? 1.0f : static_cast<float>(hw_threads));
}

void
DefaultBatchOptions(proto::BatchOptions* options)
{
  options->Clear();
  options->set_enabled(true);
  options->set_max_batch_size(kDefaultMaxBatchSize);
  options->set_max_latency_ms(kDefaultMaxLatencyMs);
}

Status
GetRunnerConfig(const std::string& path, proto::RunnerConfig* config)
{
  RETURN_IF_ERROR(ReadTextProto(path, config));

  if (!config->has_resource_quota()) {
    DefaultResourceQuota(config->mutable_resource_quota());
    LOG_VERBOSE(1) << "no resource quota in " << path << ", using "
                   << config->resource_quota().cpu() << " cpu";
  }
  if (!config->has_batch_options()) {
    DefaultBatchOptions(config->mutable_batch_options());
  }

  RETURN_IF_ERROR_WITH_PREFIX(
      ValidateResourceQuota(config->resource_quota()),
      "invalid runner configuration " + path);
  RETURN_IF_ERROR_WITH_PREFIX(
      ValidateBatchOptions(config->batch_options()),
      "invalid runner configuration " + path);

  return Status::Success;
}

}  // namespace modelrunner
