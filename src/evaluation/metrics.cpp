// File: evaluation/metrics.cpp

#include "evaluation/metrics.hpp"

#include <set>

#include "common/formatting/fmt_metrics.hpp"
#include "common/logging/logger.hpp"

namespace evaluation {

    void MetricsEngine::validate(const std::vector<ClassLabel> &ground_truths,
                                 const std::vector<ClassLabel> &predictions) {
        if (ground_truths.empty() || predictions.empty()) {
            LOG_ERROR("Metrics requested for an empty input ({} ground truths, {} predictions)", ground_truths.size(),
                      predictions.size());
            throw MetricsInputError("Cannot compute metrics without any evaluated sample");
        }
        if (ground_truths.size() != predictions.size()) {
            LOG_ERROR("Metrics input length mismatch: {} ground truths vs {} predictions", ground_truths.size(),
                      predictions.size());
            throw MetricsInputError(fmt::format("Ground truths ({}) and predictions ({}) differ in length",
                                                ground_truths.size(), predictions.size()));
        }
    }

    ConfusionMatrix MetricsEngine::buildConfusionMatrix(const std::vector<ClassLabel> &ground_truths,
                                                        const std::vector<ClassLabel> &predictions) {
        validate(ground_truths, predictions);

        std::set<ClassLabel> labels(ground_truths.begin(), ground_truths.end());
        labels.insert(predictions.begin(), predictions.end());

        ConfusionMatrix matrix({labels.begin(), labels.end()});
        for (std::size_t i = 0; i < ground_truths.size(); ++i) {
            matrix.add(ground_truths[i], predictions[i]);
        }
        return matrix;
    }

    Evaluation MetricsEngine::evaluate(const std::vector<ClassLabel> &ground_truths,
                                       const std::vector<ClassLabel> &predictions) {
        Evaluation evaluation = fromConfusionMatrix(buildConfusionMatrix(ground_truths, predictions));
        LOG_INFO("Evaluated {} samples over {} labels: {}", evaluation.sample_count, evaluation.matrix.size(),
                 evaluation.metrics);
        return evaluation;
    }

    Evaluation MetricsEngine::fromConfusionMatrix(const ConfusionMatrix &matrix) {
        const auto total = matrix.sum();
        if (total <= 0) {
            throw MetricsInputError("Confusion matrix holds no samples");
        }

        Evaluation evaluation;
        evaluation.matrix = matrix;
        evaluation.sample_count = static_cast<std::size_t>(total);
        evaluation.metrics.accuracy = static_cast<double>(matrix.trace()) / static_cast<double>(total);

        const auto &labels = matrix.labels();
        evaluation.per_label.reserve(labels.size());
        for (std::size_t i = 0; i < labels.size(); ++i) {
            const auto tp = static_cast<double>(matrix.counts()(static_cast<Eigen::Index>(i),
                                                                static_cast<Eigen::Index>(i)));
            const auto predicted = matrix.predictedCount(i);
            const auto actual = matrix.actualCount(i);
            const double fp = static_cast<double>(predicted) - tp;
            const double fn = static_cast<double>(actual) - tp;

            LabelMetrics label_metrics;
            label_metrics.label = labels[i];
            label_metrics.precision = tp / (tp + fp + epsilon_);
            label_metrics.recall = tp / (tp + fn + epsilon_);
            label_metrics.f1 = 2.0 * label_metrics.precision * label_metrics.recall /
                               (label_metrics.precision + label_metrics.recall + epsilon_);
            label_metrics.support = static_cast<std::size_t>(actual);
            label_metrics.predicted = static_cast<std::size_t>(predicted);

            evaluation.metrics.precision += label_metrics.precision;
            evaluation.metrics.recall += label_metrics.recall;
            evaluation.metrics.f1 += label_metrics.f1;
            evaluation.per_label.push_back(std::move(label_metrics));
        }

        const auto label_count = static_cast<double>(labels.size());
        evaluation.metrics.precision /= label_count;
        evaluation.metrics.recall /= label_count;
        evaluation.metrics.f1 /= label_count;
        return evaluation;
    }

} // namespace evaluation
