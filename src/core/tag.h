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
#include <string>
#include "src/core/status.h"

namespace modelrunner {

//
// Identifier of a stored model version, written as "<name>:<version>".
//
struct Tag {
  Tag() = default;
  Tag(const std::string& name, const std::string& version)
      : name_(name), version_(version)
  {
  }

  // True if the tag names no specific version and should resolve to
  // the newest version of the model.
  bool IsLatest() const;

  std::string ToString() const;

  std::string name_;
  std::string version_;
};

/// Parse a tag string. A string without ':' is a tag with an empty
/// version, which resolves to the latest version.
/// \param str The tag string.
/// \param tag Returns the parsed tag.
/// \return INVALID_ARG if the name or version is malformed.
Status ParseTag(const std::string& str, Tag* tag);

/// Check that a model name is a valid identifier.
Status ValidateModelName(const std::string& name);

/// Format the system-generated version string for a version number.
std::string VersionString(const uint64_t number);

/// Get the version number from a system-generated version string.
/// \return INVALID_ARG if 'version' was not generated by the store.
Status VersionNumber(const std::string& version, uint64_t* number);

}  // namespace modelrunner
