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

#include "runner_config.pb.h"
#include "src/core/status.h"

namespace modelrunner {

/// Check that a resource quota can size a runner: 'cpu' must be finite
/// and not negative and GPU ids must not be negative.
Status ValidateResourceQuota(const proto::ResourceQuota& quota);

/// Check that batch options are well formed.
Status ValidateBatchOptions(const proto::BatchOptions& options);

/// Fill the quota used when a caller supplies none: every hardware
/// thread of the host and no GPUs.
void DefaultResourceQuota(proto::ResourceQuota* quota);

/// Fill the batch options used when a caller supplies none.
void DefaultBatchOptions(proto::BatchOptions* options);

/// Read a RunnerConfig prototext file, default the sections it does
/// not set and validate the result.
/// \param path The path of the runner configuration file.
/// \param config Returns the runner configuration.
/// \return The error status.
Status GetRunnerConfig(const std::string& path, proto::RunnerConfig* config);

}  // namespace modelrunner
