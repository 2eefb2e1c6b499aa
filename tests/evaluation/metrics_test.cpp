// tests/evaluation/metrics_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "evaluation/metrics.hpp"

using namespace evaluation;
using ::testing::ElementsAre;

namespace {
    constexpr double tolerance = 1e-4;

    const LabelMetrics &labelMetrics(const Evaluation &evaluation, const std::string &label) {
        const auto it = std::ranges::find(evaluation.per_label, label, &LabelMetrics::label);
        EXPECT_NE(it, evaluation.per_label.end()) << label;
        return *it;
    }

    void expectBounded(const Evaluation &evaluation) {
        const auto inUnitRange = [](const double value) { return value >= 0.0 && value <= 1.0; };
        EXPECT_TRUE(inUnitRange(evaluation.metrics.accuracy));
        EXPECT_TRUE(inUnitRange(evaluation.metrics.precision));
        EXPECT_TRUE(inUnitRange(evaluation.metrics.recall));
        EXPECT_TRUE(inUnitRange(evaluation.metrics.f1));
        for (const auto &label: evaluation.per_label) {
            EXPECT_TRUE(inUnitRange(label.precision)) << label.label;
            EXPECT_TRUE(inUnitRange(label.recall)) << label.label;
            EXPECT_TRUE(inUnitRange(label.f1)) << label.label;
        }
    }
} // namespace

TEST(MetricsEngineTest, TwoClassScenario) {
    const auto evaluation = MetricsEngine::evaluate({"A", "A", "B", "B"}, {"A", "B", "B", "B"});

    EXPECT_THAT(evaluation.matrix.labels(), ElementsAre("A", "B"));
    EXPECT_EQ(evaluation.matrix.at("A", "A"), 1);
    EXPECT_EQ(evaluation.matrix.at("A", "B"), 1);
    EXPECT_EQ(evaluation.matrix.at("B", "A"), 0);
    EXPECT_EQ(evaluation.matrix.at("B", "B"), 2);

    EXPECT_NEAR(evaluation.metrics.accuracy, 0.5, tolerance);
    EXPECT_NEAR(labelMetrics(evaluation, "A").precision, 1.0, tolerance);
    EXPECT_NEAR(labelMetrics(evaluation, "A").recall, 0.5, tolerance);
    EXPECT_NEAR(labelMetrics(evaluation, "B").precision, 0.6667, tolerance);
    EXPECT_NEAR(labelMetrics(evaluation, "B").recall, 1.0, tolerance);

    EXPECT_NEAR(evaluation.metrics.precision, (1.0 + 2.0 / 3.0) / 2.0, tolerance);
    EXPECT_NEAR(evaluation.metrics.recall, 0.75, tolerance);
    EXPECT_NEAR(evaluation.metrics.f1, (2.0 / 3.0 + 0.8) / 2.0, tolerance);
    EXPECT_EQ(labelMetrics(evaluation, "B").support, 2);
    EXPECT_EQ(labelMetrics(evaluation, "B").predicted, 3);
}

TEST(MetricsEngineTest, MatrixSumEqualsSampleCount) {
    const std::vector<ClassLabel> ground_truths{"cat", "dog", "dog", "bird", "cat", "cat", "bird"};
    const std::vector<ClassLabel> predictions{"cat", "cat", "dog", "dog", "cat", "bird", "bird"};
    const auto evaluation = MetricsEngine::evaluate(ground_truths, predictions);

    EXPECT_EQ(evaluation.matrix.sum(), static_cast<ConfusionMatrix::Count>(ground_truths.size()));
    EXPECT_EQ(evaluation.sample_count, ground_truths.size());
    EXPECT_DOUBLE_EQ(evaluation.metrics.accuracy, static_cast<double>(evaluation.matrix.trace()) /
                                                          static_cast<double>(evaluation.matrix.sum()));
    expectBounded(evaluation);
}

TEST(MetricsEngineTest, LabelWithoutPredictionsDoesNotRaise) {
    const auto evaluation = MetricsEngine::evaluate({"A", "B", "C"}, {"A", "B", "B"});

    const auto &c = labelMetrics(evaluation, "C");
    EXPECT_DOUBLE_EQ(c.precision, 0.0);
    EXPECT_DOUBLE_EQ(c.recall, 0.0);
    EXPECT_DOUBLE_EQ(c.f1, 0.0);
    EXPECT_EQ(c.predicted, 0);
    expectBounded(evaluation);
}

TEST(MetricsEngineTest, PredictionOnlyLabelsJoinTheMatrix) {
    const auto evaluation = MetricsEngine::evaluate({"A", "A"}, {"A", "Z"});
    EXPECT_THAT(evaluation.matrix.labels(), ElementsAre("A", "Z"));
    EXPECT_EQ(evaluation.matrix.at("A", "Z"), 1);
    EXPECT_EQ(labelMetrics(evaluation, "Z").support, 0);
}

TEST(MetricsEngineTest, ResultIsIndependentOfPairOrder) {
    std::vector<std::pair<ClassLabel, ClassLabel>> pairs{{"A", "A"}, {"A", "B"}, {"B", "B"}, {"C", "A"},
                                                         {"C", "C"}, {"B", "C"}, {"A", "A"}};
    const auto evaluate = [](const std::vector<std::pair<ClassLabel, ClassLabel>> &input) {
        std::vector<ClassLabel> ground_truths;
        std::vector<ClassLabel> predictions;
        for (const auto &[truth, prediction]: input) {
            ground_truths.push_back(truth);
            predictions.push_back(prediction);
        }
        return MetricsEngine::evaluate(ground_truths, predictions);
    };

    const auto reference = evaluate(pairs);
    std::mt19937 engine(5);
    std::shuffle(pairs.begin(), pairs.end(), engine);
    const auto shuffled = evaluate(pairs);

    EXPECT_EQ(reference.matrix, shuffled.matrix);
    EXPECT_DOUBLE_EQ(reference.metrics.f1, shuffled.metrics.f1);
}

TEST(MetricsEngineTest, RejectsEmptyInput) {
    EXPECT_THROW(static_cast<void>(MetricsEngine::evaluate({}, {})), MetricsInputError);
}

TEST(MetricsEngineTest, RejectsMismatchedInput) {
    EXPECT_THROW(static_cast<void>(MetricsEngine::evaluate({"A", "B"}, {"A"})), MetricsInputError);
}

TEST(MetricsEngineTest, RejectsEmptyMatrix) {
    EXPECT_THROW(static_cast<void>(MetricsEngine::fromConfusionMatrix(ConfusionMatrix({"A"}))), MetricsInputError);
}
