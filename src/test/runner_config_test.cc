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

#include <limits>
#include <string>
#include <thread>
#include "src/core/constants.h"
#include "src/core/filesystem.h"
#include "src/core/runner_config_utils.h"

namespace mr = modelrunner;

namespace {

class RunnerConfigTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    auto status = mr::MakeTemporaryDirectory("/tmp", "config_test_", &dir_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
  }

  void TearDown() override
  {
    auto status = mr::DeleteDirectory(dir_);
    EXPECT_TRUE(status.IsOk()) << status.AsString();
  }

  std::string WriteConfig(const std::string& contents)
  {
    const std::string path = mr::JoinPath({dir_, "runner_config.pbtxt"});
    auto status = mr::WriteTextFile(path, contents);
    EXPECT_TRUE(status.IsOk()) << status.AsString();
    return path;
  }

  std::string dir_;
};

TEST(ResourceQuotaTest, Validate)
{
  mr::proto::ResourceQuota quota;
  EXPECT_TRUE(mr::ValidateResourceQuota(quota).IsOk());

  quota.set_cpu(2.5f);
  quota.add_gpus(0);
  EXPECT_TRUE(mr::ValidateResourceQuota(quota).IsOk());

  quota.set_cpu(-0.5f);
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(std::numeric_limits<float>::quiet_NaN());
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(std::numeric_limits<float>::infinity());
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(mr::kMaxResourceQuotaCpu);
  EXPECT_TRUE(mr::ValidateResourceQuota(quota).IsOk());

  quota.set_cpu(mr::kMaxResourceQuotaCpu + 1);
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(1e30f);
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(1.0f);
  quota.add_gpus(-1);
  EXPECT_EQ(
      mr::ValidateResourceQuota(quota).StatusCode(),
      mr::Status::Code::INVALID_ARG);
}

TEST(BatchOptionsTest, Validate)
{
  mr::proto::BatchOptions options;
  mr::DefaultBatchOptions(&options);
  EXPECT_TRUE(options.enabled());
  EXPECT_EQ(options.max_batch_size(), 100);
  EXPECT_EQ(options.max_latency_ms(), 10000);
  EXPECT_EQ(options.input_batch_axis(), 0);
  EXPECT_EQ(options.output_batch_axis(), 0);
  EXPECT_TRUE(mr::ValidateBatchOptions(options).IsOk());

  options.set_max_latency_ms(-1);
  EXPECT_EQ(
      mr::ValidateBatchOptions(options).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  mr::DefaultBatchOptions(&options);
  options.set_output_batch_axis(-1);
  EXPECT_EQ(
      mr::ValidateBatchOptions(options).StatusCode(),
      mr::Status::Code::INVALID_ARG);
}

TEST(ResourceQuotaTest, Default)
{
  mr::proto::ResourceQuota quota;
  quota.add_gpus(3);
  mr::DefaultResourceQuota(&quota);

  const unsigned int hw_threads = std::thread::hardware_concurrency();
  EXPECT_FLOAT_EQ(quota.cpu(), (hw_threads == 0) ? 1.0f : hw_threads);
  EXPECT_EQ(quota.gpus_size(), 0);
}

TEST_F(RunnerConfigTest, ReadFull)
{
  const std::string path = WriteConfig(R"(
resource_quota {
  cpu: 3.5
  gpus: [ 0, 1 ]
}
batch_options {
  enabled: false
  max_batch_size: 32
  max_latency_ms: 250
  output_batch_axis: 1
}
)");

  mr::proto::RunnerConfig config;
  auto status = mr::GetRunnerConfig(path, &config);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_FLOAT_EQ(config.resource_quota().cpu(), 3.5f);
  EXPECT_EQ(config.resource_quota().gpus_size(), 2);
  EXPECT_FALSE(config.batch_options().enabled());
  EXPECT_EQ(config.batch_options().max_batch_size(), 32);
  EXPECT_EQ(config.batch_options().max_latency_ms(), 250);
  EXPECT_EQ(config.batch_options().output_batch_axis(), 1);
}

TEST_F(RunnerConfigTest, MissingSectionsDefaulted)
{
  const std::string path = WriteConfig("resource_quota { cpu: 2 }\n");

  mr::proto::RunnerConfig config;
  auto status = mr::GetRunnerConfig(path, &config);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_FLOAT_EQ(config.resource_quota().cpu(), 2.0f);
  EXPECT_TRUE(config.batch_options().enabled());
  EXPECT_EQ(config.batch_options().max_batch_size(), 100);

  const std::string empty = WriteConfig("");
  ASSERT_TRUE(mr::GetRunnerConfig(empty, &config).IsOk());
  EXPECT_GE(config.resource_quota().cpu(), 1.0f);
}

TEST_F(RunnerConfigTest, InvalidConfig)
{
  mr::proto::RunnerConfig config;

  const std::string negative = WriteConfig("resource_quota { cpu: -2 }\n");
  auto status = mr::GetRunnerConfig(negative, &config);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::INVALID_ARG);

  const std::string malformed = WriteConfig("resource_quota { cpu: lots }\n");
  EXPECT_FALSE(mr::GetRunnerConfig(malformed, &config).IsOk());

  EXPECT_FALSE(
      mr::GetRunnerConfig(mr::JoinPath({dir_, "missing.pbtxt"}), &config)
          .IsOk());
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
