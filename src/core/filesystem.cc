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

#include "src/core/filesystem.h"

#include <dirent.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/text_format.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <fstream>
#include <vector>

namespace modelrunner {

namespace {

// Check if a local path is a directory.
Status
IsPathDirectory(const std::string& path, bool* is_dir)
{
  *is_dir = false;

  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return Status(Status::Code::INTERNAL, "failed to stat file " + path);
  }

  *is_dir = S_ISDIR(st.st_mode);
  return Status::Success;
}

bool
IsAbsolutePath(const std::string& path)
{
  return !path.empty() && (path[0] == '/');
}

std::string
DirName(const std::string& path)
{
  if (path.empty()) {
    return path;
  }

  size_t last = path.size() - 1;
  while ((last > 0) && (path[last] == '/')) {
    last -= 1;
  }

  if (path[last] == '/') {
    return std::string("/");
  }

  const size_t idx = path.find_last_of("/", last);
  if (idx == std::string::npos) {
    return std::string(".");
  }
  if (idx == 0) {
    return std::string("/");
  }

  return path.substr(0, idx);
}

}  // namespace

std::string
JoinPath(std::initializer_list<std::string> segments)
{
  std::string joined;

  for (const auto& seg : segments) {
    if (joined.empty()) {
      joined = seg;
    } else if (IsAbsolutePath(seg)) {
      if (joined[joined.size() - 1] == '/') {
        joined.append(seg.substr(1));
      } else {
        joined.append(seg);
      }
    } else {  // !IsAbsolutePath(seg)
      if (joined[joined.size() - 1] != '/') {
        joined.append("/");
      }
      joined.append(seg);
    }
  }

  return joined;
}

Status
FileExists(const std::string& path, bool* exists)
{
  *exists = (access(path.c_str(), F_OK) == 0);
  return Status::Success;
}

Status
GetDirectoryContents(const std::string& path, std::set<std::string>* contents)
{
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    return Status(Status::Code::INTERNAL, "failed to open directory " + path);
  }

  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    std::string entryname = entry->d_name;
    if ((entryname != ".") && (entryname != "..")) {
      contents->insert(entryname);
    }
  }

  closedir(dir);
  return Status::Success;
}

Status
GetDirectorySubdirs(const std::string& path, std::set<std::string>* subdirs)
{
  RETURN_IF_ERROR(GetDirectoryContents(path, subdirs));

  // Erase non-directory entries...
  for (auto iter = subdirs->begin(); iter != subdirs->end();) {
    bool is_dir;
    RETURN_IF_ERROR(IsPathDirectory(JoinPath({path, *iter}), &is_dir));
    if (!is_dir) {
      iter = subdirs->erase(iter);
    } else {
      ++iter;
    }
  }

  return Status::Success;
}

Status
ReadTextFile(const std::string& path, std::string* contents)
{
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return Status(
        Status::Code::INTERNAL,
        "failed to open text file for read " + path + ": " + strerror(errno));
  }

  in.seekg(0, std::ios::end);
  contents->resize(in.tellg());
  in.seekg(0, std::ios::beg);
  in.read(&(*contents)[0], contents->size());
  in.close();

  return Status::Success;
}

Status
WriteTextFile(const std::string& path, const std::string& contents)
{
  std::ofstream out(path, std::ios::out | std::ios::binary);
  if (!out) {
    return Status(
        Status::Code::INTERNAL,
        "failed to open text file for write " + path + ": " + strerror(errno));
  }

  out.write(contents.data(), contents.size());
  out.close();
  if (!out) {
    return Status(
        Status::Code::INTERNAL, "failed to write text file " + path);
  }

  return Status::Success;
}

Status
ReadTextProto(const std::string& path, google::protobuf::Message* msg)
{
  std::string contents;
  RETURN_IF_ERROR(ReadTextFile(path, &contents));

  if (!google::protobuf::TextFormat::ParseFromString(contents, msg)) {
    return Status(
        Status::Code::INTERNAL, "failed to read text proto from " + path);
  }

  return Status::Success;
}

Status
WriteTextProto(const std::string& path, const google::protobuf::Message& msg)
{
  std::string prototxt;
  if (!google::protobuf::TextFormat::PrintToString(msg, &prototxt)) {
    return Status(
        Status::Code::INTERNAL, "failed to write text proto to " + path);
  }

  return WriteTextFile(path, prototxt);
}

Status
ReadBinaryProto(const std::string& path, google::protobuf::MessageLite* msg)
{
  std::string msg_str;
  RETURN_IF_ERROR(ReadTextFile(path, &msg_str));

  google::protobuf::io::CodedInputStream coded_stream(
      reinterpret_cast<const uint8_t*>(msg_str.c_str()), msg_str.size());
  coded_stream.SetTotalBytesLimit(INT_MAX);
  if (!msg->ParseFromCodedStream(&coded_stream)) {
    return Status(
        Status::Code::INTERNAL, "Can't parse " + path + " as binary proto");
  }

  return Status::Success;
}

Status
WriteBinaryProto(
    const std::string& path, const google::protobuf::MessageLite& msg)
{
  std::string msg_str;
  if (!msg.SerializeToString(&msg_str)) {
    return Status(
        Status::Code::INTERNAL, "failed to serialize binary proto for " + path);
  }

  return WriteTextFile(path, msg_str);
}

Status
MakeDirectory(const std::string& path)
{
  bool exists;
  RETURN_IF_ERROR(FileExists(path, &exists));
  if (exists) {
    bool is_dir;
    RETURN_IF_ERROR(IsPathDirectory(path, &is_dir));
    if (!is_dir) {
      return Status(
          Status::Code::INTERNAL,
          "failed to create directory " + path + ": path is a file");
    }
    return Status::Success;
  }

  const std::string parent = DirName(path);
  if ((parent != path) && (parent != ".") && (parent != "/")) {
    RETURN_IF_ERROR(MakeDirectory(parent));
  }

  if ((mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != 0) &&
      (errno != EEXIST)) {
    return Status(
        Status::Code::INTERNAL,
        "failed to create directory " + path + ": " + strerror(errno));
  }

  return Status::Success;
}

Status
MakeTemporaryDirectory(
    const std::string& parent, const std::string& prefix,
    std::string* temp_dir)
{
  std::string folder_template = JoinPath({parent, prefix + "XXXXXX"});
  std::vector<char> buf(folder_template.begin(), folder_template.end());
  buf.push_back('\0');
  char* res = mkdtemp(buf.data());
  if (res == nullptr) {
    return Status(
        Status::Code::INTERNAL,
        "Failed to create local temp folder: " + folder_template +
            ", errno:" + strerror(errno));
  }
  *temp_dir = res;
  return Status::Success;
}

Status
DeleteDirectory(const std::string& path)
{
  std::set<std::string> contents;
  RETURN_IF_ERROR(GetDirectoryContents(path, &contents));

  for (const auto& content : contents) {
    std::string full_path = JoinPath({path, content});
    bool is_dir = false;
    RETURN_IF_ERROR(IsPathDirectory(full_path, &is_dir));
    if (is_dir) {
      RETURN_IF_ERROR(DeleteDirectory(full_path));
    } else if (remove(full_path.c_str()) != 0) {
      return Status(
          Status::Code::INTERNAL,
          "failed to delete file " + full_path + ": " + strerror(errno));
    }
  }

  if (rmdir(path.c_str()) != 0) {
    return Status(
        Status::Code::INTERNAL,
        "failed to delete directory " + path + ": " + strerror(errno));
  }

  return Status::Success;
}

Status
RenamePath(const std::string& from, const std::string& to)
{
  if (rename(from.c_str(), to.c_str()) != 0) {
    if ((errno == EEXIST) || (errno == ENOTEMPTY)) {
      return Status(
          Status::Code::ALREADY_EXISTS,
          "failed to rename " + from + " to " + to + ": target exists");
    }
    return Status(
        Status::Code::INTERNAL,
        "failed to rename " + from + " to " + to + ": " + strerror(errno));
  }

  return Status::Success;
}

}  // namespace modelrunner
