// tests/executor_test.cpp

#include <gtest/gtest.h>

#include <memory>

#include "config/configuration.hpp"
#include "executor.hpp"
#include "test_utils.hpp"

class ExecutorTest : public ::testing::Test {
protected:
    static std::unique_ptr<test_utils::TemporaryDirectory> directory_;

    // The configuration is a process-wide singleton, so it is loaded once for the whole suite.
    static void SetUpTestSuite() {
        directory_ = std::make_unique<test_utils::TemporaryDirectory>();
        const auto file = test_utils::touch(*directory_ / "configuration.yaml", R"(task: evaluate
paths:
  model: ./models/classifier.onnx
  labels: ./models/labels.txt
  dataset: ./dataset
  output: ./output
evaluation:
  sample_count: 5
  parallel: true
  report_title: Nightly
random:
  seed: 1234
split:
  train_ratio: 0.7
  val_ratio: 0.1
  keep: true
classifier:
  input_width: 256
  input_height: 192
  mean: [ 1.0, 2.0, 3.0 ]
  swap_rb: false
training:
  command: "train.sh {train} {val} {model}"
)");
        config::initialize(file.string());
    }

    static void TearDownTestSuite() { directory_.reset(); }
};

std::unique_ptr<test_utils::TemporaryDirectory> ExecutorTest::directory_;

TEST_F(ExecutorTest, ParsesTasks) {
    EXPECT_EQ(Executor::parseTask("evaluate"), Executor::Task::Evaluate);
    EXPECT_EQ(Executor::parseTask("train"), Executor::Task::Train);
    EXPECT_EQ(Executor::parseTask("evaluate_and_train"), Executor::Task::EvaluateAndTrain);
    EXPECT_THROW(static_cast<void>(Executor::parseTask("deploy")), std::invalid_argument);
}

TEST_F(ExecutorTest, ConfiguredSeedIsUsed) { EXPECT_EQ(Executor::seed(), 1234u); }

TEST_F(ExecutorTest, EvaluationOptionsComeFromConfiguration) {
    const auto options = Executor::evaluationOptions();
    EXPECT_EQ(options.dataset_root, std::filesystem::path("./dataset"));
    EXPECT_EQ(options.output_directory, std::filesystem::path("./output"));
    EXPECT_EQ(options.sample_count, 5);
    EXPECT_TRUE(options.parallel);
    EXPECT_EQ(options.report_title, "Nightly");
    EXPECT_EQ(options.report_name, "report.html");
    EXPECT_EQ(options.seed, 1234u);
}

TEST_F(ExecutorTest, ClassifierOptionsComeFromConfiguration) {
    const auto options = Executor::classifierOptions();
    EXPECT_EQ(options.model_path, std::filesystem::path("./models/classifier.onnx"));
    EXPECT_EQ(options.labels_path, std::filesystem::path("./models/labels.txt"));
    EXPECT_EQ(options.input_size, cv::Size(256, 192));
    EXPECT_DOUBLE_EQ(options.mean[2], 3.0);
    EXPECT_FALSE(options.swap_rb);
    EXPECT_DOUBLE_EQ(options.scale, 1.0 / 255.0);
}

TEST_F(ExecutorTest, TrainingOptionsComeFromConfiguration) {
    const auto options = Executor::trainingOptions();
    EXPECT_DOUBLE_EQ(options.ratios.train, 0.7);
    EXPECT_DOUBLE_EQ(options.ratios.val, 0.1);
    EXPECT_TRUE(options.keep_work_directories);
    EXPECT_EQ(options.work_directory, std::filesystem::temp_directory_path());
    EXPECT_EQ(options.report_name, "training_report.html");

    const auto trainer = Executor::trainerOptions();
    EXPECT_EQ(trainer.command, "train.sh {train} {val} {model}");
    EXPECT_EQ(trainer.model_name, "model.onnx");
}

TEST_F(ExecutorTest, InputsMustAllBeSelected) {
    EXPECT_TRUE(Executor::allInputsSelected());

    const auto partial = test_utils::touch(*directory_ / "partial.yaml", R"(paths:
  model: ./models/classifier.onnx
  dataset: ./dataset
  output: ""
)");
    EXPECT_FALSE(Executor::allInputsSelected(config::Configuration(partial.string())));

    const auto empty = test_utils::touch(*directory_ / "empty.yaml", "task: evaluate\n");
    EXPECT_FALSE(Executor::allInputsSelected(config::Configuration(empty.string())));
}
