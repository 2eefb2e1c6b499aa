// File: evaluation/confusion_matrix.hpp

#ifndef EVALUATION_CONFUSION_MATRIX_HPP
#define EVALUATION_CONFUSION_MATRIX_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Core>

#include "types/sample.hpp"

namespace evaluation {

    /*
     * Square count table. Rows are ground-truth labels, columns predicted labels, both in the order of labels()
     * (sorted). sum() always equals the number of pairs added.
     */
    class ConfusionMatrix {
    public:
        using Count = std::int64_t;
        using Counts = Eigen::Matrix<Count, Eigen::Dynamic, Eigen::Dynamic>;

        ConfusionMatrix() = default;

        // Labels are sorted and de-duplicated.
        explicit ConfusionMatrix(std::vector<ClassLabel> labels);

        // Throws std::out_of_range for a label outside labels().
        void add(const ClassLabel &ground_truth, const ClassLabel &prediction);

        [[nodiscard]] const std::vector<ClassLabel> &labels() const noexcept { return labels_; }
        [[nodiscard]] std::size_t size() const noexcept { return labels_.size(); }
        [[nodiscard]] const Counts &counts() const noexcept { return counts_; }

        [[nodiscard]] std::optional<std::size_t> indexOf(const ClassLabel &label) const;
        [[nodiscard]] Count at(const ClassLabel &ground_truth, const ClassLabel &prediction) const;

        [[nodiscard]] Count sum() const { return counts_.sum(); }
        [[nodiscard]] Count trace() const { return counts_.trace(); }

        // Column sum: how often the label was predicted.
        [[nodiscard]] Count predictedCount(const std::size_t index) const {
            return counts_.col(static_cast<Eigen::Index>(index)).sum();
        }
        // Row sum: how often the label was the ground truth.
        [[nodiscard]] Count actualCount(const std::size_t index) const {
            return counts_.row(static_cast<Eigen::Index>(index)).sum();
        }

        bool operator==(const ConfusionMatrix &other) const {
            return labels_ == other.labels_ && counts_ == other.counts_;
        }

    private:
        std::vector<ClassLabel> labels_;
        std::unordered_map<ClassLabel, std::size_t> index_;
        Counts counts_;
    };

} // namespace evaluation

#endif // EVALUATION_CONFUSION_MATRIX_HPP
