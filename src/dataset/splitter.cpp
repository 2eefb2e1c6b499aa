// File: dataset/splitter.cpp

#include "dataset/splitter.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace dataset {

    namespace {
        // Keeps floor(5 * 0.6) at 3 when the product lands a hair below the integer.
        constexpr double rounding_tolerance_ = 1e-9;
    } // namespace

    void SplitRatios::validate() const {
        if (train < 0.0 || val < 0.0 || train + val > 1.0 + rounding_tolerance_) {
            throw std::invalid_argument(
                    fmt::format("Invalid split ratios: train={}, val={} (must be >= 0 and sum to <= 1)", train, val));
        }
    }

    DatasetSplitter::DatasetSplitter(const SplitRatios ratios) : ratios_(ratios) { ratios_.validate(); }

    SplitCounts DatasetSplitter::counts(const std::size_t total) const noexcept {
        const auto n = static_cast<double>(total);
        SplitCounts counts;
        counts.train = std::min(total, static_cast<std::size_t>(std::floor(n * ratios_.train + rounding_tolerance_)));
        counts.val = std::min(total - counts.train,
                              static_cast<std::size_t>(std::floor(n * ratios_.val + rounding_tolerance_)));
        counts.test = total - counts.train - counts.val;
        return counts;
    }

    SplitAssignment DatasetSplitter::assign(const SamplesByClass &samples, const std::uint32_t seed) const {
        std::mt19937 engine(seed);
        SplitAssignment assignment;

        for (const auto &[label, class_samples]: samples) {
            Samples shuffled = class_samples;
            std::shuffle(shuffled.begin(), shuffled.end(), engine);

            const auto [train_count, val_count, test_count] = counts(shuffled.size());
            const auto train_end = shuffled.begin() + static_cast<std::ptrdiff_t>(train_count);
            const auto val_end = train_end + static_cast<std::ptrdiff_t>(val_count);

            ClassSplit &split = assignment[label];
            split.train.assign(shuffled.begin(), train_end);
            split.val.assign(train_end, val_end);
            split.test.assign(val_end, shuffled.end());

            if (split.train.empty() || split.val.empty() || split.test.empty()) {
                LOG_WARN("Class '{}' has {} images, split {}/{}/{} leaves a subset empty", label, shuffled.size(),
                         train_count, val_count, test_count);
            } else {
                LOG_DEBUG("Class '{}': train={}, val={}, test={}", label, train_count, val_count, test_count);
            }
        }
        return assignment;
    }

    SplitReport DatasetSplitter::materialize(const SplitAssignment &assignment,
                                             const SplitDestinations &destinations) const {
        SplitReport report;
        report.assignment = assignment;

        for (const auto &[label, split]: assignment) {
            copySubset(label, split.train, destinations.train, report);
            copySubset(label, split.val, destinations.val, report);
            copySubset(label, split.test, destinations.test, report);
        }

        if (report.failures.empty()) {
            report.events.info(stage_, "Copied {} images into train/val/test", report.copied);
        } else {
            report.events.warn(stage_, "Copied {} images, {} copies failed", report.copied, report.failures.size());
        }
        return report;
    }

    SplitReport DatasetSplitter::split(const SamplesByClass &samples, const SplitDestinations &destinations,
                                       const std::uint32_t seed) const {
        LOG_INFO("Splitting {} classes with ratios {}/{}/{} (seed {})", samples.size(), ratios_.train, ratios_.val,
                 1.0 - ratios_.train - ratios_.val, seed);
        return materialize(assign(samples, seed), destinations);
    }

    void DatasetSplitter::copySubset(const ClassLabel &label, const Samples &subset, const std::filesystem::path &root,
                                     SplitReport &report) {
        const auto class_directory = root / label;
        const auto record = [&report](const Sample &sample, const std::filesystem::path &destination,
                                      const std::string &reason) {
            SplitIOError error(sample.getImagePath(), destination, reason);
            report.events.error(stage_, "{}", error.what());
            report.failures.push_back(std::move(error));
        };

        // Class folders are created even for empty subsets so every split mirrors the class list.
        try {
            common::io::createDirectory(class_directory);
        } catch (const std::runtime_error &e) {
            for (const auto &sample: subset) {
                record(sample, class_directory / sample.getImagePath().filename(), e.what());
            }
            return;
        }

        for (const auto &sample: subset) {
            const auto destination = class_directory / sample.getImagePath().filename();
            try {
                common::io::copyFile(sample.getImagePath(), destination);
                ++report.copied;
            } catch (const std::runtime_error &e) {
                record(sample, destination, e.what());
            }
        }
    }

} // namespace dataset
