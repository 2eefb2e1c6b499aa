// tests/config/configuration_test.cpp

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config/configuration.hpp"
#include "test_utils.hpp"

using config::Configuration;

class ConfigurationTest : public ::testing::Test {
protected:
    test_utils::TemporaryDirectory directory;
    std::filesystem::path file;

    void SetUp() override {
        file = test_utils::touch(directory / "configuration.yaml", R"(task: train
paths:
  dataset: ./dataset
  output: ./output
evaluation:
  sample_count: 5
  parallel: true
classifier:
  mean: [ 104.0, 117.0, 123.0 ]
split:
  train_ratio: 0.7
)");
    }
};

TEST_F(ConfigurationTest, FlattensNestedKeys) {
    const Configuration configuration(file.string());

    EXPECT_EQ(configuration.get<std::string>("task"), "train");
    EXPECT_EQ(configuration.get<std::string>("paths.dataset"), "./dataset");
    EXPECT_EQ(configuration.get("evaluation.sample_count", 3), 5);
    EXPECT_TRUE(configuration.get("evaluation.parallel", false));
    EXPECT_DOUBLE_EQ(configuration.get("split.train_ratio", 0.6), 0.7);
    EXPECT_EQ(configuration.get<std::string>("paths.output"), "./output");
    EXPECT_FALSE(configuration.get<std::string>("paths").has_value());
}

TEST_F(ConfigurationTest, SequencesStayWhole) {
    const Configuration configuration(file.string());
    const auto mean = configuration.get("classifier.mean", std::vector<double>{});
    ASSERT_EQ(mean.size(), 3);
    EXPECT_DOUBLE_EQ(mean[2], 123.0);
}

TEST_F(ConfigurationTest, MissingKeysFallBackToDefaults) {
    const Configuration configuration(file.string());

    EXPECT_FALSE(configuration.get<int>("random.seed").has_value());
    EXPECT_EQ(configuration.get("random.seed", 42), 42);
    EXPECT_EQ(configuration.get("paths.labels", "labels.txt"), "labels.txt");
    EXPECT_DOUBLE_EQ(configuration.get("split.val_ratio", 0.2), 0.2);
}

TEST_F(ConfigurationTest, WrongTypeFallsBackToDefault) {
    const Configuration configuration(file.string());
    EXPECT_EQ(configuration.get("paths.dataset", 7), 7);
}

TEST_F(ConfigurationTest, MissingFileThrows) {
    EXPECT_THROW(Configuration((directory / "absent.yaml").string()), std::runtime_error);
}
