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

#include "src/core/tag.h"

#include <re2/re2.h>
#include <stdlib.h>
#include "src/core/constants.h"

namespace modelrunner {

namespace {

const RE2&
NameRegex()
{
  static const RE2 regex("[A-Za-z_][A-Za-z0-9_]*");
  return regex;
}

const RE2&
VersionRegex()
{
  static const RE2 regex("[A-Za-z0-9_.\\-]+");
  return regex;
}

const RE2&
GeneratedVersionRegex()
{
  static const RE2 regex(std::string(kVersionPrefix) + "([1-9][0-9]{0,18})");
  return regex;
}

}  // namespace

bool
Tag::IsLatest() const
{
  return version_.empty() || (version_ == kLatestVersion);
}

std::string
Tag::ToString() const
{
  return name_ + ":" + (version_.empty() ? kLatestVersion : version_);
}

Status
ValidateModelName(const std::string& name)
{
  if (!RE2::FullMatch(name, NameRegex())) {
    return Status(
        Status::Code::INVALID_ARG,
        "model name '" + name +
            "' is not a valid identifier, expected letters, digits and "
            "underscores not starting with a digit");
  }

  return Status::Success;
}

Status
ParseTag(const std::string& str, Tag* tag)
{
  const size_t pos = str.find(':');
  const std::string name = str.substr(0, pos);
  const std::string version =
      (pos == std::string::npos) ? std::string() : str.substr(pos + 1);

  RETURN_IF_ERROR_WITH_PREFIX(
      ValidateModelName(name), "invalid tag '" + str + "'");
  if ((pos != std::string::npos) &&
      !RE2::FullMatch(version, VersionRegex())) {
    return Status(
        Status::Code::INVALID_ARG,
        "invalid tag '" + str + "': malformed version '" + version + "'");
  }

  tag->name_ = name;
  tag->version_ = version;
  return Status::Success;
}

std::string
VersionString(const uint64_t number)
{
  return kVersionPrefix + std::to_string(number);
}

Status
VersionNumber(const std::string& version, uint64_t* number)
{
  std::string digits;
  if (!RE2::FullMatch(version, GeneratedVersionRegex(), &digits)) {
    return Status(
        Status::Code::INVALID_ARG,
        "'" + version + "' is not a generated model version");
  }

  *number = strtoull(digits.c_str(), nullptr, 10);
  return Status::Success;
}

}  // namespace modelrunner
