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

#include <memory>
#include <string>
#include "src/backends/predictor/artifact_codec.h"
#include "src/core/constants.h"
#include "src/core/filesystem.h"
#include "src/test/predictor_test_util.h"

namespace mr = modelrunner;

namespace {

class ArtifactCodecTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    auto status = mr::MakeTemporaryDirectory("/tmp", "codec_test_", &dir_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
  }

  void TearDown() override
  {
    auto status = mr::DeleteDirectory(dir_);
    EXPECT_TRUE(status.IsOk()) << status.AsString();
  }

  void WriteArtifact(const mr::proto::PredictorArtifact& artifact)
  {
    auto status = mr::WriteBinaryProto(
        mr::ProtoArtifactCodec::ArtifactPath(dir_), artifact);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
  }

  std::string dir_;
  mr::ProtoArtifactCodec codec_;
};

TEST_F(ArtifactCodecTest, SupportedFamilies)
{
  EXPECT_EQ(
      codec_.SupportedFamilies(),
      std::vector<std::string>({"linear", "tree_ensemble"}));
  EXPECT_EQ(
      mr::ProtoArtifactCodec::ArtifactPath("/models/iris/v1"),
      "/models/iris/v1/saved_model.pb");
}

TEST_F(ArtifactCodecTest, LinearRoundTrip)
{
  std::unique_ptr<mr::LinearModel> model;
  ASSERT_TRUE(mr::LinearModel::Create(
                  mr::test::IrisLinearParams(), mr::test::IrisFeatureNames(),
                  &model)
                  .IsOk());
  ASSERT_TRUE(codec_.Dump(*model, dir_).IsOk());

  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_EQ(loaded->Family(), "linear");
  EXPECT_EQ(loaded->FeatureNames(), mr::test::IrisFeatureNames());

  mr::Matrix input, expected, output;
  ASSERT_TRUE(mr::Matrix::FromRows(mr::test::IrisSamples(), &input).IsOk());
  ASSERT_TRUE(model->Predict(input, nullptr, &expected).IsOk());
  ASSERT_TRUE(loaded->Predict(input, nullptr, &output).IsOk());
  EXPECT_EQ(output, expected);
}

TEST_F(ArtifactCodecTest, TreeEnsembleRoundTrip)
{
  std::unique_ptr<mr::TreeEnsemble> model;
  ASSERT_TRUE(mr::TreeEnsemble::Create(
                  mr::test::ClassificationForestParams(), {}, &model)
                  .IsOk());
  ASSERT_TRUE(codec_.Dump(*model, dir_).IsOk());

  std::unique_ptr<mr::Predictor> loaded;
  ASSERT_TRUE(codec_.Load(dir_, &loaded).IsOk());
  EXPECT_EQ(loaded->Family(), "tree_ensemble");
  EXPECT_TRUE(loaded->FeatureNames().empty());

  mr::Matrix input, output;
  ASSERT_TRUE(mr::Matrix::FromRows({{-1}, {0.5}, {2}}, &input).IsOk());
  ASSERT_TRUE(loaded->Predict(input, nullptr, &output).IsOk());
  EXPECT_EQ(output.RowVector(0), std::vector<double>({10}));
  EXPECT_EQ(output.RowVector(1), std::vector<double>({20}));
  EXPECT_EQ(output.RowVector(2), std::vector<double>({30}));
}

TEST_F(ArtifactCodecTest, MissingArtifact)
{
  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::CORRUPT);
}

TEST_F(ArtifactCodecTest, GarbageArtifact)
{
  ASSERT_TRUE(mr::WriteTextFile(
                  mr::ProtoArtifactCodec::ArtifactPath(dir_),
                  std::string("\xff\xff\xff\xff not a protobuf", 20))
                  .IsOk());

  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::CORRUPT);
}

TEST_F(ArtifactCodecTest, UnknownFamily)
{
  mr::proto::PredictorArtifact artifact;
  artifact.set_format_version(mr::kArtifactFormatVersion);
  WriteArtifact(artifact);

  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::CORRUPT);
}

TEST_F(ArtifactCodecTest, NewerFormat)
{
  mr::proto::PredictorArtifact artifact;
  artifact.set_format_version(mr::kArtifactFormatVersion + 1);
  *artifact.mutable_linear() = mr::test::IrisLinearParams();
  WriteArtifact(artifact);

  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::CORRUPT);
}

TEST_F(ArtifactCodecTest, InvalidModel)
{
  mr::proto::PredictorArtifact artifact;
  artifact.set_format_version(mr::kArtifactFormatVersion);
  *artifact.mutable_linear() = mr::test::IrisLinearParams();
  artifact.mutable_linear()->add_coef(1.0);
  WriteArtifact(artifact);

  std::unique_ptr<mr::Predictor> loaded;
  auto status = codec_.Load(dir_, &loaded);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::CORRUPT);
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
