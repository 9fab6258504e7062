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

#include "gtest/gtest.h"

#include "src/core/tag.h"

namespace mr = modelrunner;

namespace {

TEST(TagTest, ParseNameAndVersion)
{
  mr::Tag tag;
  auto status = mr::ParseTag("iris:v1", &tag);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_EQ(tag.name_, "iris");
  EXPECT_EQ(tag.version_, "v1");
  EXPECT_FALSE(tag.IsLatest());
  EXPECT_EQ(tag.ToString(), "iris:v1");
}

TEST(TagTest, ParseBareName)
{
  mr::Tag tag;
  auto status = mr::ParseTag("my_model", &tag);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_EQ(tag.name_, "my_model");
  EXPECT_TRUE(tag.version_.empty());
  EXPECT_TRUE(tag.IsLatest());
  EXPECT_EQ(tag.ToString(), "my_model:latest");
}

TEST(TagTest, ParseLatest)
{
  mr::Tag tag;
  auto status = mr::ParseTag("iris:latest", &tag);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_TRUE(tag.IsLatest());
}

TEST(TagTest, ParseMalformed)
{
  const std::vector<std::string> malformed{
      "", ":v1", "1iris:v1", "ir-is:v1", "iris:", "iris:v1:v2", "iris:v 1"};
  for (const auto& str : malformed) {
    mr::Tag tag;
    auto status = mr::ParseTag(str, &tag);
    EXPECT_EQ(status.StatusCode(), mr::Status::Code::INVALID_ARG)
        << "expected '" << str << "' to be rejected";
  }
}

TEST(TagTest, ValidateModelName)
{
  EXPECT_TRUE(mr::ValidateModelName("iris").IsOk());
  EXPECT_TRUE(mr::ValidateModelName("_private2").IsOk());
  EXPECT_FALSE(mr::ValidateModelName("2fast").IsOk());
  EXPECT_FALSE(mr::ValidateModelName("with.dot").IsOk());
  EXPECT_FALSE(mr::ValidateModelName("").IsOk());
}

TEST(TagTest, GeneratedVersions)
{
  EXPECT_EQ(mr::VersionString(1), "v1");
  EXPECT_EQ(mr::VersionString(42), "v42");

  uint64_t number = 0;
  ASSERT_TRUE(mr::VersionNumber("v42", &number).IsOk());
  EXPECT_EQ(number, 42u);

  EXPECT_FALSE(mr::VersionNumber("v0", &number).IsOk());
  EXPECT_FALSE(mr::VersionNumber("v01", &number).IsOk());
  EXPECT_FALSE(mr::VersionNumber("latest", &number).IsOk());
  EXPECT_FALSE(mr::VersionNumber(".staging-abc123", &number).IsOk());
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
