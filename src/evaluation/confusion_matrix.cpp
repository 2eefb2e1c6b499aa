// File: evaluation/confusion_matrix.cpp

#include "evaluation/confusion_matrix.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace evaluation {

    ConfusionMatrix::ConfusionMatrix(std::vector<ClassLabel> labels) : labels_(std::move(labels)) {
        std::ranges::sort(labels_);
        const auto [first, last] = std::ranges::unique(labels_);
        labels_.erase(first, last);

        index_.reserve(labels_.size());
        for (std::size_t i = 0; i < labels_.size(); ++i) {
            index_.emplace(labels_[i], i);
        }

        const auto n = static_cast<Eigen::Index>(labels_.size());
        counts_ = Counts::Zero(n, n);
    }

    std::optional<std::size_t> ConfusionMatrix::indexOf(const ClassLabel &label) const {
        const auto it = index_.find(label);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void ConfusionMatrix::add(const ClassLabel &ground_truth, const ClassLabel &prediction) {
        const auto row = indexOf(ground_truth);
        const auto col = indexOf(prediction);
        if (!row || !col) {
            throw std::out_of_range(
                    fmt::format("Pair ({}, {}) is not covered by the confusion matrix labels", ground_truth, prediction));
        }
        ++counts_(static_cast<Eigen::Index>(*row), static_cast<Eigen::Index>(*col));
    }

    ConfusionMatrix::Count ConfusionMatrix::at(const ClassLabel &ground_truth, const ClassLabel &prediction) const {
        const auto row = indexOf(ground_truth);
        const auto col = indexOf(prediction);
        if (!row || !col) {
            throw std::out_of_range(fmt::format("Unknown label pair ({}, {})", ground_truth, prediction));
        }
        return counts_(static_cast<Eigen::Index>(*row), static_cast<Eigen::Index>(*col));
    }

} // namespace evaluation
