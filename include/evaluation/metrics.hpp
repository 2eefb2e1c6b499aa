// File: evaluation/metrics.hpp

#ifndef EVALUATION_METRICS_HPP
#define EVALUATION_METRICS_HPP

#include <cstddef>
#include <vector>

#include "evaluation/confusion_matrix.hpp"
#include "types/errors.hpp"
#include "types/sample.hpp"

namespace evaluation {

    // Macro averages: every label weighs the same regardless of its support.
    struct Metrics {
        double accuracy = 0.0;
        double precision = 0.0;
        double recall = 0.0;
        double f1 = 0.0;
    };

    struct LabelMetrics {
        ClassLabel label;
        double precision = 0.0;
        double recall = 0.0;
        double f1 = 0.0;
        std::size_t support = 0;   // ground-truth occurrences
        std::size_t predicted = 0; // prediction occurrences
    };

    struct Evaluation {
        Metrics metrics;
        ConfusionMatrix matrix;
        std::vector<LabelMetrics> per_label; // same order as matrix.labels()
        std::size_t sample_count = 0;
    };

    class MetricsEngine {
    public:
        static constexpr double epsilon_ = 1e-10;

        /*
         * ground_truths[i] and predictions[i] describe the same image. The label set is the sorted union of both
         * sequences. Throws MetricsInputError when the sequences are empty or differ in length.
         */
        [[nodiscard]] static Evaluation evaluate(const std::vector<ClassLabel> &ground_truths,
                                                 const std::vector<ClassLabel> &predictions);

        [[nodiscard]] static ConfusionMatrix buildConfusionMatrix(const std::vector<ClassLabel> &ground_truths,
                                                                  const std::vector<ClassLabel> &predictions);

        // Per-label and macro metrics straight from a matrix; accuracy = trace / sum.
        [[nodiscard]] static Evaluation fromConfusionMatrix(const ConfusionMatrix &matrix);

    private:
        static void validate(const std::vector<ClassLabel> &ground_truths, const std::vector<ClassLabel> &predictions);
    };

} // namespace evaluation

#endif // EVALUATION_METRICS_HPP
