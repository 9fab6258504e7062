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
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "model_info.pb.h"
#include "src/core/constants.h"
#include "src/core/status.h"
#include "src/core/tag.h"

namespace modelrunner {

using ModelMetadata = google::protobuf::Map<std::string, proto::MetadataValue>;
using FrameworkContext = std::map<std::string, std::string>;

class ModelStore;

//
// A version of a model that is being registered. The caller writes
// the model artifact into Path() and then calls Commit() to publish
// the version under Tag(). If the registration is destroyed without a
// successful Commit() everything written is removed and the tag never
// becomes visible.
//
class ModelRegistration {
 public:
  ~ModelRegistration();

  // The directory to write the model artifact into.
  const std::string& Path() const { return staging_path_; }

  // The tag the version is published under once committed.
  const std::string& Tag() const { return info_.tag(); }

  const proto::ModelInfo& Info() const { return info_; }

  bool IsCommitted() const { return committed_; }

  // Publish the version. Can only succeed once.
  Status Commit();

 private:
  DISALLOW_COPY_AND_ASSIGN(ModelRegistration);
  friend class ModelStore;

  ModelRegistration(
      ModelStore* store, const proto::ModelInfo& info,
      const uint64_t version_number, const std::string& staging_path,
      const std::string& final_path);

  // The store that allocated this registration. The store must
  // outlive the registration.
  ModelStore* store_;

  proto::ModelInfo info_;
  const uint64_t version_number_;
  const std::string staging_path_;
  const std::string final_path_;
  bool committed_;
};

//
// File-system backed store of model versions. Each version lives in
// '<root>/<name>/<version>' together with a 'model_info.pbtxt' holding
// its ModelInfo.
//
class ModelStore {
 public:
  /// Create a store rooted at a directory, creating the directory if
  /// needed.
  /// \param root The root directory of the store.
  /// \param store Returns the model store.
  /// \return The error status.
  static Status Create(
      const std::string& root, std::unique_ptr<ModelStore>* store);

  const std::string& Root() const { return root_; }

  /// Resolve a tag to the information of a committed model version.
  /// "<name>" and "<name>:latest" resolve to the newest version.
  /// \param tag The tag to resolve.
  /// \param info Returns the model information, with 'path' set to the
  /// directory of the version.
  /// \return NOT_FOUND if the tag is unknown.
  Status Get(const std::string& tag, proto::ModelInfo* info);

  /// Start the registration of a new version of a model. The version
  /// is allocated immediately but only becomes visible on commit.
  /// \param name The model name, must be a valid identifier.
  /// \param module The identity of the adapter saving the model.
  /// \param metadata User metadata recorded with the version.
  /// \param framework_context Library versions used for the artifact.
  /// \param registration Returns the registration.
  /// \return The error status.
  Status Register(
      const std::string& name, const std::string& module,
      const ModelMetadata& metadata,
      const FrameworkContext& framework_context,
      std::unique_ptr<ModelRegistration>* registration);

  /// List committed versions, oldest first per model.
  /// \param name The model to list, or empty to list every model.
  /// \param tags Returns the tags.
  /// \return The error status.
  Status List(const std::string& name, std::vector<std::string>* tags);

  /// Remove a committed version from the store.
  /// \param tag The tag of the version.
  /// \return NOT_FOUND if the tag is unknown.
  Status Delete(const std::string& tag);

 private:
  DISALLOW_COPY_AND_ASSIGN(ModelStore);
  friend class ModelRegistration;

  explicit ModelStore(const std::string& root) : root_(root) {}

  // Get the version numbers committed for a model. Must be called
  // with 'mu_' held.
  Status CommittedVersions(
      const std::string& name, std::set<uint64_t>* versions);

  // Resolve a tag to the directory of a committed version. Must be
  // called with 'mu_' held.
  Status ResolveTag(const std::string& tag, Tag* resolved, std::string* path);

  // Get the newest version number ever committed for a model, 0 if
  // none. Must be called with 'mu_' held.
  Status LastVersion(const std::string& name, uint64_t* number);

  // Persist 'number' as the newest version committed for a model.
  Status RecordLastVersion(const std::string& name, const uint64_t number);

  // Drop the in-flight reservation of a version number.
  void ReleaseVersion(const std::string& name, const uint64_t number);

  const std::string root_;

  std::mutex mu_;

  // Version numbers handed out to registrations that have not
  // committed or rolled back yet.
  std::map<std::string, std::set<uint64_t>> reserved_;
};

}  // namespace modelrunner
