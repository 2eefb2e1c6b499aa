// File: dataset/splitter.hpp

#ifndef DATASET_SPLITTER_HPP
#define DATASET_SPLITTER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string_view>
#include <vector>

#include "common/logging/event_log.hpp"
#include "dataset/indexer.hpp"
#include "types/errors.hpp"
#include "types/sample.hpp"

namespace dataset {

    struct SplitRatios {
        double train = 0.6;
        double val = 0.2;

        // Throws std::invalid_argument unless both ratios are non-negative and sum to at most 1.
        void validate() const;
    };

    struct SplitCounts {
        std::size_t train = 0;
        std::size_t val = 0;
        std::size_t test = 0;
    };

    struct ClassSplit {
        Samples train;
        Samples val;
        Samples test;

        [[nodiscard]] std::size_t size() const noexcept { return train.size() + val.size() + test.size(); }
    };

    using SplitAssignment = std::map<ClassLabel, ClassSplit>;

    struct SplitDestinations {
        std::filesystem::path train;
        std::filesystem::path val;
        std::filesystem::path test;
    };

    struct SplitReport {
        SplitAssignment assignment;
        std::size_t copied = 0;
        std::vector<SplitIOError> failures;
        common::logging::EventLog events;
    };

    /*
     * Class-stratified train/val/test split. Every class is shuffled on its own and cut into
     * floor(n * train), floor(n * val) and the remainder. Small classes may end up with empty subsets.
     */
    class DatasetSplitter {
    public:
        static constexpr std::string_view stage_ = "splitting";

        explicit DatasetSplitter(SplitRatios ratios = {});

        [[nodiscard]] const SplitRatios &ratios() const noexcept { return ratios_; }

        [[nodiscard]] SplitCounts counts(std::size_t total) const noexcept;

        // Pure assignment, reproducible for a given seed.
        [[nodiscard]] SplitAssignment assign(const SamplesByClass &samples, std::uint32_t seed) const;

        /*
         * Copies every assigned image to {destination}/{class}/{file name}. Destinations are expected to be empty.
         * A file that cannot be copied is recorded as a SplitIOError and skipped.
         */
        [[nodiscard]] SplitReport materialize(const SplitAssignment &assignment,
                                              const SplitDestinations &destinations) const;

        [[nodiscard]] SplitReport split(const SamplesByClass &samples, const SplitDestinations &destinations,
                                        std::uint32_t seed) const;

    private:
        SplitRatios ratios_;

        static void copySubset(const ClassLabel &label, const Samples &subset, const std::filesystem::path &root,
                               SplitReport &report);
    };

} // namespace dataset

#endif // DATASET_SPLITTER_HPP
