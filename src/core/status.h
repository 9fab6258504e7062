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

#include <string>

namespace modelrunner {

class Status {
 public:
  // Error codes
  enum class Code {
    SUCCESS,
    INTERNAL,
    NOT_FOUND,
    INVALID_ARG,
    UNSUPPORTED,
    ALREADY_EXISTS,
    MODULE_MISMATCH,
    CORRUPT,
    MISSING_DEPENDENCY
  };

  // Construct a status from a code with no message.
  explicit Status(Code code = Code::SUCCESS) : code_(code) {}

  // Construct a status from a code and message.
  explicit Status(Code code, const std::string& msg) : code_(code), msg_(msg)
  {
  }

  // Convenience "success" value. Can be used as Status::Success to
  // indicate no error.
  static const Status Success;

  // Return the code for this status.
  Code StatusCode() const { return code_; }

  // Return the message for this status.
  const std::string& Message() const { return msg_; }

  // Return true if this status indicates "ok"/"success", false if
  // status indicates some kind of failure.
  bool IsOk() const { return code_ == Code::SUCCESS; }

  // Return the status as a string.
  std::string AsString() const;

  // Return the constant string name for a code.
  static const char* CodeString(const Code code);

 private:
  Code code_;
  std::string msg_;
};

// If status is non-OK, return the Status.
#define RETURN_IF_ERROR(S)                     \
  do {                                         \
    const modelrunner::Status& status__ = (S); \
    if (!status__.IsOk()) {                    \
      return status__;                         \
    }                                          \
  } while (false)

// If status is non-OK, return a Status carrying the same code with
// 'MSG' prepended to the message.
#define RETURN_IF_ERROR_WITH_PREFIX(S, MSG)                     \
  do {                                                          \
    const modelrunner::Status& status__ = (S);                  \
    if (!status__.IsOk()) {                                     \
      return modelrunner::Status(                               \
          status__.StatusCode(),                                \
          std::string(MSG) + ": " + status__.Message());        \
    }                                                           \
  } while (false)

}  // namespace modelrunner
