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

#include <stdint.h>

namespace modelrunner {

#ifndef MODELRUNNER_VERSION
#define MODELRUNNER_VERSION "0.1.0"
#endif  // MODELRUNNER_VERSION

constexpr char kModelInfoPbTxt[] = "model_info.pbtxt";

// Artifact written by an adapter into a registered model directory is
// named '<kSaveNamespace><kModelExt>'.
constexpr char kSaveNamespace[] = "saved_model";
constexpr char kModelExt[] = ".pb";

// Prefix of system-generated model versions, e.g. "v3".
constexpr char kVersionPrefix[] = "v";
constexpr char kLatestVersion[] = "latest";

// File in '<root>/<name>' recording the newest version ever committed,
// so a deleted version number is never handed out again.
constexpr char kLastVersionFile[] = ".last_version";

// Prefix of the staging directory used while a version is registered.
constexpr char kStagingPrefix[] = ".staging-";

constexpr char kPredictorModule[] = "modelrunner.predictor";
constexpr char kLinearFamily[] = "linear";
constexpr char kTreeEnsembleFamily[] = "tree_ensemble";

// Newest predictor artifact format that this build can read.
constexpr uint32_t kArtifactFormatVersion = 1;

// Largest 'cpu' a resource quota may declare. Each unit becomes one
// worker thread of a replica.
constexpr float kMaxResourceQuotaCpu = 4096.0f;

constexpr int kDefaultMaxBatchSize = 100;
constexpr int kDefaultMaxLatencyMs = 10000;

#define DISALLOW_COPY(TypeName) TypeName(const TypeName&) = delete;
#define DISALLOW_ASSIGN(TypeName) void operator=(const TypeName&) = delete;
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  DISALLOW_COPY(TypeName)                  \
  DISALLOW_ASSIGN(TypeName)

}  // namespace modelrunner
