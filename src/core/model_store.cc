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

#include "src/core/model_store.h"

#include <chrono>
#include "src/core/filesystem.h"
#include "src/core/logging.h"

namespace modelrunner {

namespace {

uint64_t
NowNanoseconds()
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

//
// ModelRegistration
//
ModelRegistration::ModelRegistration(
    ModelStore* store, const proto::ModelInfo& info,
    const uint64_t version_number, const std::string& staging_path,
    const std::string& final_path)
    : store_(store), info_(info), version_number_(version_number),
      staging_path_(staging_path), final_path_(final_path), committed_(false)
{
}

ModelRegistration::~ModelRegistration()
{
  if (!committed_) {
    LOG_VERBOSE(1) << "rolling back registration of '" << info_.tag() << "'";
    LOG_STATUS_ERROR(
        DeleteDirectory(staging_path_),
        "failed to remove staging directory of '" + info_.tag() + "'");
    store_->ReleaseVersion(info_.name(), version_number_);
  }
}

Status
ModelRegistration::Commit()
{
  if (committed_) {
    return Status(
        Status::Code::ALREADY_EXISTS,
        "registration of '" + info_.tag() + "' is already committed");
  }

  info_.set_creation_time_ns(NowNanoseconds());
  RETURN_IF_ERROR(
      WriteTextProto(JoinPath({staging_path_, kModelInfoPbTxt}), info_));
  // Recorded before the version becomes visible. If the rename fails
  // the number is skipped rather than reused.
  RETURN_IF_ERROR(store_->RecordLastVersion(info_.name(), version_number_));
  RETURN_IF_ERROR(RenamePath(staging_path_, final_path_));

  committed_ = true;
  store_->ReleaseVersion(info_.name(), version_number_);

  LOG_INFO << "registered model '" << info_.tag() << "' (module "
           << info_.module() << ")";
  return Status::Success;
}

//
// ModelStore
//
Status
ModelStore::Create(const std::string& root, std::unique_ptr<ModelStore>* store)
{
  if (root.empty()) {
    return Status(
        Status::Code::INVALID_ARG, "model store root must not be empty");
  }

  RETURN_IF_ERROR_WITH_PREFIX(
      MakeDirectory(root), "failed to create model store at '" + root + "'");

  store->reset(new ModelStore(root));
  return Status::Success;
}

Status
ModelStore::CommittedVersions(
    const std::string& name, std::set<uint64_t>* versions)
{
  const std::string model_dir = JoinPath({root_, name});
  bool exists;
  RETURN_IF_ERROR(FileExists(model_dir, &exists));
  if (!exists) {
    return Status::Success;
  }

  std::set<std::string> subdirs;
  RETURN_IF_ERROR(GetDirectorySubdirs(model_dir, &subdirs));
  for (const auto& subdir : subdirs) {
    uint64_t number;
    if (!VersionNumber(subdir, &number).IsOk()) {
      // Staging directories and anything not created by the store.
      continue;
    }
    versions->insert(number);
  }

  return Status::Success;
}

Status
ModelStore::LastVersion(const std::string& name, uint64_t* number)
{
  *number = 0;

  const std::string path = JoinPath({root_, name, kLastVersionFile});
  bool exists;
  RETURN_IF_ERROR(FileExists(path, &exists));
  if (!exists) {
    return Status::Success;
  }

  std::string contents;
  RETURN_IF_ERROR(ReadTextFile(path, &contents));
  const size_t end = contents.find_last_not_of(" \t\r\n");
  contents.erase((end == std::string::npos) ? 0 : end + 1);
  RETURN_IF_ERROR_WITH_PREFIX(
      VersionNumber(contents, number),
      "invalid last version of model '" + name + "'");

  return Status::Success;
}

Status
ModelStore::RecordLastVersion(const std::string& name, const uint64_t number)
{
  std::lock_guard<std::mutex> lock(mu_);

  uint64_t last;
  RETURN_IF_ERROR(LastVersion(name, &last));
  if (number <= last) {
    return Status::Success;
  }

  const std::string path = JoinPath({root_, name, kLastVersionFile});
  const std::string tmp_path = path + ".tmp";
  RETURN_IF_ERROR(WriteTextFile(tmp_path, VersionString(number) + "\n"));
  RETURN_IF_ERROR(RenamePath(tmp_path, path));

  return Status::Success;
}

Status
ModelStore::ResolveTag(const std::string& tag, Tag* resolved, std::string* path)
{
  RETURN_IF_ERROR(ParseTag(tag, resolved));

  if (resolved->IsLatest()) {
    std::set<uint64_t> versions;
    RETURN_IF_ERROR(CommittedVersions(resolved->name_, &versions));
    if (versions.empty()) {
      return Status(
          Status::Code::NOT_FOUND,
          "no version of model '" + resolved->name_ + "' found in store " +
              root_);
    }
    resolved->version_ = VersionString(*versions.rbegin());
  }

  *path = JoinPath({root_, resolved->name_, resolved->version_});

  bool exists;
  RETURN_IF_ERROR(FileExists(JoinPath({*path, kModelInfoPbTxt}), &exists));
  if (!exists) {
    return Status(
        Status::Code::NOT_FOUND,
        "model '" + resolved->ToString() + "' not found in store " + root_);
  }

  return Status::Success;
}

Status
ModelStore::Get(const std::string& tag, proto::ModelInfo* info)
{
  std::lock_guard<std::mutex> lock(mu_);

  Tag resolved;
  std::string path;
  RETURN_IF_ERROR(ResolveTag(tag, &resolved, &path));

  RETURN_IF_ERROR_WITH_PREFIX(
      ReadTextProto(JoinPath({path, kModelInfoPbTxt}), info),
      "failed to read information of model '" + resolved.ToString() + "'");
  info->set_path(path);

  return Status::Success;
}

Status
ModelStore::Register(
    const std::string& name, const std::string& module,
    const ModelMetadata& metadata, const FrameworkContext& framework_context,
    std::unique_ptr<ModelRegistration>* registration)
{
  RETURN_IF_ERROR(ValidateModelName(name));
  if (module.empty()) {
    return Status(
        Status::Code::INVALID_ARG,
        "registration of model '" + name + "' requires a module");
  }

  std::lock_guard<std::mutex> lock(mu_);

  const std::string model_dir = JoinPath({root_, name});
  RETURN_IF_ERROR(MakeDirectory(model_dir));

  // The new version follows every committed and in-flight version,
  // including committed versions that were deleted since.
  std::set<uint64_t> versions;
  RETURN_IF_ERROR(CommittedVersions(name, &versions));
  uint64_t last;
  RETURN_IF_ERROR(LastVersion(name, &last));
  versions.insert(last);
  auto& reserved = reserved_[name];
  versions.insert(reserved.begin(), reserved.end());
  const uint64_t number = *versions.rbegin() + 1;

  std::string staging_path;
  RETURN_IF_ERROR(
      MakeTemporaryDirectory(model_dir, kStagingPrefix, &staging_path));
  reserved.insert(number);

  proto::ModelInfo info;
  const Tag tag(name, VersionString(number));
  info.set_tag(tag.ToString());
  info.set_name(tag.name_);
  info.set_version(tag.version_);
  info.set_module(module);
  *info.mutable_metadata() = metadata;
  for (const auto& pr : framework_context) {
    (*info.mutable_framework_context())[pr.first] = pr.second;
  }

  registration->reset(new ModelRegistration(
      this, info, number, staging_path, JoinPath({model_dir, tag.version_})));

  LOG_VERBOSE(1) << "started registration of '" << info.tag() << "' in "
                 << staging_path;
  return Status::Success;
}

Status
ModelStore::List(const std::string& name, std::vector<std::string>* tags)
{
  std::lock_guard<std::mutex> lock(mu_);

  std::set<std::string> names;
  if (name.empty()) {
    std::set<std::string> subdirs;
    RETURN_IF_ERROR(GetDirectorySubdirs(root_, &subdirs));
    for (const auto& subdir : subdirs) {
      if (ValidateModelName(subdir).IsOk()) {
        names.insert(subdir);
      }
    }
  } else {
    RETURN_IF_ERROR(ValidateModelName(name));
    names.insert(name);
  }

  for (const auto& model_name : names) {
    std::set<uint64_t> versions;
    RETURN_IF_ERROR(CommittedVersions(model_name, &versions));
    for (const auto number : versions) {
      tags->push_back(Tag(model_name, VersionString(number)).ToString());
    }
  }

  return Status::Success;
}

Status
ModelStore::Delete(const std::string& tag)
{
  std::lock_guard<std::mutex> lock(mu_);

  Tag resolved;
  std::string path;
  RETURN_IF_ERROR(ResolveTag(tag, &resolved, &path));
  RETURN_IF_ERROR_WITH_PREFIX(
      DeleteDirectory(path),
      "failed to delete model '" + resolved.ToString() + "'");

  LOG_INFO << "deleted model '" << resolved.ToString() << "'";
  return Status::Success;
}

void
ModelStore::ReleaseVersion(const std::string& name, const uint64_t number)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto itr = reserved_.find(name);
  if (itr != reserved_.end()) {
    itr->second.erase(number);
    if (itr->second.empty()) {
      reserved_.erase(itr);
    }
  }
}

}  // namespace modelrunner
