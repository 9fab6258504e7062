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
#include <vector>
#include "src/backends/predictor/predictor.h"
#include "src/core/status.h"

namespace modelrunner {

//
// Serializes predictors into, and deserializes them from, the
// directory of a registered model version.
//
class ArtifactCodec {
 public:
  virtual ~ArtifactCodec() {}

  // The predictor families the codec can read and write.
  virtual std::vector<std::string> SupportedFamilies() const = 0;

  /// Write a predictor into a directory.
  /// \param predictor The predictor to write.
  /// \param dir The directory, which must exist.
  /// \return UNSUPPORTED if the family of the predictor is not
  /// supported by the codec.
  virtual Status Dump(const Predictor& predictor, const std::string& dir) = 0;

  /// Read the predictor written into a directory.
  /// \param dir The directory.
  /// \param predictor Returns the predictor.
  /// \return CORRUPT if the artifact is missing, unreadable or of an
  /// unknown family or format.
  virtual Status Load(
      const std::string& dir, std::unique_ptr<Predictor>* predictor) = 0;
};

//
// Codec storing a predictor as a binary PredictorArtifact protobuf in
// 'saved_model.pb'. The predictor family is chosen by which model the
// artifact holds.
//
class ProtoArtifactCodec : public ArtifactCodec {
 public:
  ProtoArtifactCodec() = default;

  // Path of the artifact file inside a model directory.
  static std::string ArtifactPath(const std::string& dir);

  std::vector<std::string> SupportedFamilies() const override;
  Status Dump(const Predictor& predictor, const std::string& dir) override;
  Status Load(
      const std::string& dir, std::unique_ptr<Predictor>* predictor) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(ProtoArtifactCodec);

  Status CreatePredictor(
      const proto::PredictorArtifact& artifact,
      std::unique_ptr<Predictor>* predictor);
};

}  // namespace modelrunner
