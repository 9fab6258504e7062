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

#include <getopt.h>
#include <stdlib.h>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "src/backends/predictor/predictor_adapter.h"
#include "src/core/logging.h"
#include "src/core/matrix.h"
#include "src/core/runner_config_utils.h"

namespace mr = modelrunner;

#define FAIL(MSG)                                 \
  do {                                            \
    std::cerr << "error: " << (MSG) << std::endl; \
    exit(1);                                      \
  } while (false)

#define FAIL_IF_ERR(X, MSG)                                           \
  do {                                                                \
    const mr::Status status__ = (X);                                  \
    if (!status__.IsOk()) {                                           \
      std::cerr << "error: " << (MSG) << ": " << status__.AsString() \
                << std::endl;                                         \
      exit(1);                                                        \
    }                                                                 \
  } while (false)

namespace {

enum OptionId {
  OPTION_MODEL_STORE = 1000,
  OPTION_TAG,
  OPTION_RUNNER_CONFIG,
  OPTION_INPUT,
  OPTION_LOG_VERBOSE,
  OPTION_HELP
};

void
Usage(char** argv, const std::string& msg = std::string())
{
  if (!msg.empty()) {
    std::cerr << msg << std::endl;
  }

  std::cerr << "Usage: " << argv[0] << " [options]" << std::endl;
  std::cerr << "\t--model-store <path> Root directory of the model store."
            << std::endl;
  std::cerr << "\t--tag <name[:version]> The model to run. Without a"
            << " version the newest version is used." << std::endl;
  std::cerr << "\t--input <path> CSV file with one sample per line. If the"
            << " first line holds column names, columns are matched to the"
            << " model features by name." << std::endl;
  std::cerr << "\t--runner-config <path> Optional runner configuration"
            << " prototext. By default every hardware thread is used."
            << std::endl;
  std::cerr << "\t--log-verbose <level> Enable verbose logging." << std::endl;

  exit(1);
}

}  // namespace

int
main(int argc, char** argv)
{
  std::string model_store_path;
  std::string tag;
  std::string runner_config_path;
  std::string input_path;
  int verbose_level = 0;

  struct option long_options[] = {
      {"model-store", required_argument, nullptr, OPTION_MODEL_STORE},
      {"tag", required_argument, nullptr, OPTION_TAG},
      {"runner-config", required_argument, nullptr, OPTION_RUNNER_CONFIG},
      {"input", required_argument, nullptr, OPTION_INPUT},
      {"log-verbose", required_argument, nullptr, OPTION_LOG_VERBOSE},
      {"help", no_argument, nullptr, OPTION_HELP},
      {nullptr, 0, nullptr, 0}};

  int flag;
  while ((flag = getopt_long(argc, argv, "", long_options, nullptr)) != -1) {
    switch (flag) {
      case OPTION_MODEL_STORE:
        model_store_path = optarg;
        break;
      case OPTION_TAG:
        tag = optarg;
        break;
      case OPTION_RUNNER_CONFIG:
        runner_config_path = optarg;
        break;
      case OPTION_INPUT:
        input_path = optarg;
        break;
      case OPTION_LOG_VERBOSE:
        verbose_level = atoi(optarg);
        break;
      case OPTION_HELP:
      case '?':
        Usage(argv);
        break;
    }
  }

  if (model_store_path.empty()) {
    Usage(argv, "--model-store must be used to specify the model store");
  }
  if (tag.empty()) {
    Usage(argv, "--tag must be used to specify the model");
  }
  if (input_path.empty()) {
    Usage(argv, "--input must be used to specify the samples");
  }

  LOG_SET_VERBOSE(verbose_level);

  mr::proto::RunnerConfig config;
  if (runner_config_path.empty()) {
    mr::DefaultResourceQuota(config.mutable_resource_quota());
    mr::DefaultBatchOptions(config.mutable_batch_options());
  } else {
    FAIL_IF_ERR(
        mr::GetRunnerConfig(runner_config_path, &config),
        "loading runner configuration");
  }

  std::unique_ptr<mr::ModelStore> store;
  FAIL_IF_ERR(
      mr::ModelStore::Create(model_store_path, &store),
      "opening model store");

  std::unique_ptr<mr::PredictorAdapter> adapter;
  FAIL_IF_ERR(
      mr::PredictorAdapter::Create(
          store.get(), std::make_shared<mr::ProtoArtifactCodec>(), &adapter),
      "creating predictor adapter");

  std::unique_ptr<mr::PredictorRunner> runner;
  FAIL_IF_ERR(
      adapter->LoadRunner(
          tag, &config.resource_quota(), &config.batch_options(), &runner),
      "loading runner for '" + tag + "'");

  std::vector<std::string> header;
  std::vector<std::vector<double>> rows;
  FAIL_IF_ERR(
      mr::ReadCsvBatch(input_path, &header, &rows), "reading input");

  mr::Matrix output;
  if (header.empty()) {
    mr::Matrix input;
    FAIL_IF_ERR(mr::Matrix::FromRows(rows, &input), "reading input");
    FAIL_IF_ERR(runner->RunBatch(input, &output), "running batch");
  } else {
    mr::Table input;
    for (size_t col = 0; col < header.size(); ++col) {
      std::vector<double> values;
      for (const auto& row : rows) {
        if (row.size() != header.size()) {
          FAIL("input rows must have " + std::to_string(header.size()) +
               " columns");
        }
        values.push_back(row[col]);
      }
      FAIL_IF_ERR(input.AddColumn(header[col], values), "reading input");
    }
    FAIL_IF_ERR(runner->RunBatch(input, &output), "running batch");
  }

  std::cout.precision(17);
  for (size_t row = 0; row < output.Rows(); ++row) {
    for (size_t col = 0; col < output.Cols(); ++col) {
      std::cout << ((col == 0) ? "" : ",") << output.At(row, col);
    }
    std::cout << std::endl;
  }

  LOG_FLUSH;
  return 0;
}
