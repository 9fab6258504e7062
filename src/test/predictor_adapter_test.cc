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
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "src/backends/predictor/predictor_adapter.h"
#include "src/core/constants.h"
#include "src/core/filesystem.h"
#include "src/test/predictor_test_util.h"

namespace mr = modelrunner;

namespace {

// Codec that can read and write nothing.
class EmptyCodec : public mr::ArtifactCodec {
 public:
  std::vector<std::string> SupportedFamilies() const override { return {}; }
  mr::Status Dump(const mr::Predictor& predictor, const std::string& dir)
      override
  {
    return mr::Status(mr::Status::Code::UNSUPPORTED, "empty codec");
  }
  mr::Status Load(
      const std::string& dir,
      std::unique_ptr<mr::Predictor>* predictor) override
  {
    return mr::Status(mr::Status::Code::UNSUPPORTED, "empty codec");
  }
};

// Codec that writes part of an artifact and then fails.
class FailingDumpCodec : public mr::ProtoArtifactCodec {
 public:
  mr::Status Dump(const mr::Predictor& predictor, const std::string& dir)
      override
  {
    RETURN_IF_ERROR(mr::WriteTextFile(ArtifactPath(dir), "partial"));
    return mr::Status(mr::Status::Code::INTERNAL, "disk full");
  }
};

class PredictorAdapterTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    auto status =
        mr::MakeTemporaryDirectory("/tmp", "adapter_test_", &root_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
    status = mr::ModelStore::Create(root_, &store_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
    status = mr::PredictorAdapter::Create(
        store_.get(), std::make_shared<mr::ProtoArtifactCodec>(), &adapter_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();

    status = mr::LinearModel::Create(
        mr::test::IrisLinearParams(), mr::test::IrisFeatureNames(), &iris_);
    ASSERT_TRUE(status.IsOk()) << status.AsString();
  }

  void TearDown() override
  {
    adapter_.reset();
    store_.reset();
    auto status = mr::DeleteDirectory(root_);
    EXPECT_TRUE(status.IsOk()) << status.AsString();
  }

  std::string SaveIris()
  {
    mr::ModelMetadata metadata;
    metadata["acc"].set_double_value(0.97);

    std::string tag;
    auto status = adapter_->Save("iris", *iris_, metadata, &tag);
    EXPECT_TRUE(status.IsOk()) << status.AsString();
    return tag;
  }

  std::string root_;
  std::unique_ptr<mr::ModelStore> store_;
  std::unique_ptr<mr::PredictorAdapter> adapter_;
  std::unique_ptr<mr::LinearModel> iris_;
};

TEST_F(PredictorAdapterTest, MissingDependencies)
{
  std::unique_ptr<mr::PredictorAdapter> adapter;
  EXPECT_EQ(
      mr::PredictorAdapter::Create(
          nullptr, std::make_shared<mr::ProtoArtifactCodec>(), &adapter)
          .StatusCode(),
      mr::Status::Code::MISSING_DEPENDENCY);
  EXPECT_EQ(
      mr::PredictorAdapter::Create(store_.get(), nullptr, &adapter)
          .StatusCode(),
      mr::Status::Code::MISSING_DEPENDENCY);
  EXPECT_EQ(
      mr::PredictorAdapter::Create(
          store_.get(), std::make_shared<EmptyCodec>(), &adapter)
          .StatusCode(),
      mr::Status::Code::MISSING_DEPENDENCY);
}

TEST_F(PredictorAdapterTest, SaveAndLoadIris)
{
  const std::string tag = SaveIris();
  EXPECT_EQ(tag, "iris:v1");

  std::unique_ptr<mr::Predictor> loaded;
  auto status = adapter_->Load("iris:v1", &loaded);
  ASSERT_TRUE(status.IsOk()) << status.AsString();

  mr::Matrix input, expected, output;
  ASSERT_TRUE(mr::Matrix::FromRows({{5.1, 3.5, 1.4, 0.2}}, &input).IsOk());
  ASSERT_TRUE(iris_->Predict(input, nullptr, &expected).IsOk());
  ASSERT_TRUE(loaded->Predict(input, nullptr, &output).IsOk());
  EXPECT_EQ(output, expected);
  EXPECT_EQ(output.RowVector(0), std::vector<double>({0}));
}

TEST_F(PredictorAdapterTest, SavedModelInfo)
{
  SaveIris();

  mr::proto::ModelInfo info;
  ASSERT_TRUE(store_->Get("iris:v1", &info).IsOk());
  EXPECT_EQ(info.module(), "modelrunner.predictor");
  EXPECT_DOUBLE_EQ(info.metadata().at("acc").double_value(), 0.97);
  EXPECT_EQ(info.framework_context().at("modelrunner"), MODELRUNNER_VERSION);
  EXPECT_EQ(info.framework_context().at("artifact_format"), "1");
  EXPECT_EQ(info.framework_context().at("predictor_family"), "linear");

  bool exists = false;
  ASSERT_TRUE(
      mr::FileExists(mr::JoinPath({info.path(), "saved_model.pb"}), &exists)
          .IsOk());
  EXPECT_TRUE(exists);
}

TEST_F(PredictorAdapterTest, SaveTwiceCreatesNewVersion)
{
  EXPECT_EQ(SaveIris(), "iris:v1");
  EXPECT_EQ(SaveIris(), "iris:v2");

  std::unique_ptr<mr::Predictor> loaded;
  EXPECT_TRUE(adapter_->Load("iris", &loaded).IsOk());
  EXPECT_TRUE(adapter_->Load("iris:v1", &loaded).IsOk());
}

TEST_F(PredictorAdapterTest, SaveTreeEnsemble)
{
  std::unique_ptr<mr::TreeEnsemble> forest;
  ASSERT_TRUE(mr::TreeEnsemble::Create(
                  mr::test::RegressionForestParams(), {}, &forest)
                  .IsOk());

  std::string tag;
  ASSERT_TRUE(
      adapter_->Save("forest", *forest, mr::ModelMetadata(), &tag).IsOk());
  EXPECT_EQ(tag, "forest:v1");

  std::unique_ptr<mr::Predictor> loaded;
  ASSERT_TRUE(adapter_->Load(tag, &loaded).IsOk());
  EXPECT_EQ(loaded->Family(), "tree_ensemble");

  mr::Matrix input, output;
  ASSERT_TRUE(mr::Matrix::FromRows({{1, 11}}, &input).IsOk());
  ASSERT_TRUE(loaded->Predict(input, nullptr, &output).IsOk());
  EXPECT_DOUBLE_EQ(output.At(0, 0), 4.0);
}

TEST_F(PredictorAdapterTest, FailedSaveLeavesNoVersion)
{
  std::unique_ptr<mr::PredictorAdapter> adapter;
  ASSERT_TRUE(mr::PredictorAdapter::Create(
                  store_.get(), std::make_shared<FailingDumpCodec>(), &adapter)
                  .IsOk());

  std::string tag;
  auto status = adapter->Save("iris", *iris_, mr::ModelMetadata(), &tag);
  EXPECT_EQ(status.StatusCode(), mr::Status::Code::INTERNAL);
  EXPECT_TRUE(tag.empty());

  std::vector<std::string> tags;
  ASSERT_TRUE(store_->List("iris", &tags).IsOk());
  EXPECT_TRUE(tags.empty());

  // Nothing is left behind in the model directory.
  std::set<std::string> contents;
  ASSERT_TRUE(
      mr::GetDirectoryContents(mr::JoinPath({root_, "iris"}), &contents)
          .IsOk());
  EXPECT_TRUE(contents.empty());

  EXPECT_EQ(SaveIris(), "iris:v1");
}

TEST_F(PredictorAdapterTest, InvalidName)
{
  std::string tag;
  EXPECT_EQ(
      adapter_->Save("not a name", *iris_, mr::ModelMetadata(), &tag)
          .StatusCode(),
      mr::Status::Code::INVALID_ARG);
}

TEST_F(PredictorAdapterTest, LoadUnknownTag)
{
  std::unique_ptr<mr::Predictor> loaded;
  EXPECT_EQ(
      adapter_->Load("iris:v1", &loaded).StatusCode(),
      mr::Status::Code::NOT_FOUND);

  std::unique_ptr<mr::PredictorRunner> runner;
  EXPECT_EQ(
      adapter_->LoadRunner("iris:v1", nullptr, nullptr, &runner).StatusCode(),
      mr::Status::Code::NOT_FOUND);
}

TEST_F(PredictorAdapterTest, ModuleMismatch)
{
  std::unique_ptr<mr::ModelRegistration> registration;
  ASSERT_TRUE(store_
                  ->Register(
                      "foreign", "other.framework", mr::ModelMetadata(),
                      mr::FrameworkContext(), &registration)
                  .IsOk());
  ASSERT_TRUE(mr::WriteTextFile(
                  mr::JoinPath({registration->Path(), "model.bin"}), "x")
                  .IsOk());
  ASSERT_TRUE(registration->Commit().IsOk());

  std::unique_ptr<mr::Predictor> loaded;
  EXPECT_EQ(
      adapter_->Load("foreign:v1", &loaded).StatusCode(),
      mr::Status::Code::MODULE_MISMATCH);

  std::unique_ptr<mr::PredictorRunner> runner;
  EXPECT_EQ(
      adapter_->LoadRunner("foreign:v1", nullptr, nullptr, &runner)
          .StatusCode(),
      mr::Status::Code::MODULE_MISMATCH);
}

TEST_F(PredictorAdapterTest, CorruptArtifact)
{
  SaveIris();
  mr::proto::ModelInfo info;
  ASSERT_TRUE(store_->Get("iris:v1", &info).IsOk());
  ASSERT_TRUE(mr::WriteTextFile(
                  mr::JoinPath({info.path(), "saved_model.pb"}),
                  std::string("\xff\xff\xff\xff", 4))
                  .IsOk());

  std::unique_ptr<mr::Predictor> loaded;
  EXPECT_EQ(
      adapter_->Load("iris:v1", &loaded).StatusCode(),
      mr::Status::Code::CORRUPT);
}

TEST_F(PredictorAdapterTest, LoadRunnerDefaults)
{
  SaveIris();

  std::unique_ptr<mr::PredictorRunner> runner;
  auto status = adapter_->LoadRunner("iris:v1", nullptr, nullptr, &runner);
  ASSERT_TRUE(status.IsOk()) << status.AsString();

  const unsigned int hw_threads = std::thread::hardware_concurrency();
  EXPECT_FLOAT_EQ(
      runner->Quota().cpu(), (hw_threads == 0) ? 1.0f : hw_threads);
  EXPECT_EQ(runner->Quota().gpus_size(), 0);
  EXPECT_TRUE(runner->Options().enabled());
  EXPECT_EQ(runner->Options().max_batch_size(), 100);
  EXPECT_EQ(runner->Options().max_latency_ms(), 10000);
  EXPECT_EQ(runner->NumReplica(), 1u);
  EXPECT_EQ(runner->RequiredModels(), std::vector<std::string>({"iris:v1"}));
}

TEST_F(PredictorAdapterTest, LoadRunnerQuota)
{
  SaveIris();

  mr::proto::ResourceQuota quota;
  quota.set_cpu(2.6f);
  std::unique_ptr<mr::PredictorRunner> runner;
  ASSERT_TRUE(adapter_->LoadRunner("iris:v1", &quota, nullptr, &runner).IsOk());
  EXPECT_EQ(runner->NumConcurrencyPerReplica(), 3u);

  mr::Matrix input, output;
  ASSERT_TRUE(mr::Matrix::FromRows(mr::test::IrisSamples(), &input).IsOk());
  auto status = runner->RunBatch(input, &output);
  ASSERT_TRUE(status.IsOk()) << status.AsString();
  EXPECT_EQ(output.Rows(), 3u);
  EXPECT_EQ(output.RowVector(2), std::vector<double>({2}));

  quota.set_cpu(-1);
  EXPECT_EQ(
      adapter_->LoadRunner("iris:v1", &quota, nullptr, &runner).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  quota.set_cpu(1e30f);
  EXPECT_EQ(
      adapter_->LoadRunner("iris:v1", &quota, nullptr, &runner).StatusCode(),
      mr::Status::Code::INVALID_ARG);

  mr::proto::BatchOptions options;
  options.set_max_batch_size(-5);
  quota.set_cpu(1);
  EXPECT_EQ(
      adapter_->LoadRunner("iris:v1", &quota, &options, &runner).StatusCode(),
      mr::Status::Code::INVALID_ARG);
}

TEST_F(PredictorAdapterTest, RunnerOutlivesDeletedVersionUntilFirstBatch)
{
  SaveIris();

  std::unique_ptr<mr::PredictorRunner> runner;
  ASSERT_TRUE(
      adapter_->LoadRunner("iris", nullptr, nullptr, &runner).IsOk());
  EXPECT_EQ(runner->RequiredModels(), std::vector<std::string>({"iris:v1"}));

  // The artifact is only read by the first batch. A save after the
  // delete gets a new tag and is never picked up by this runner.
  ASSERT_TRUE(store_->Delete("iris:v1").IsOk());
  EXPECT_EQ(SaveIris(), "iris:v2");

  std::vector<double> prediction;
  EXPECT_EQ(
      runner->Run({5.1, 3.5, 1.4, 0.2}, &prediction).StatusCode(),
      mr::Status::Code::CORRUPT);
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
