// File: reporting/sample_exporter.hpp

#ifndef REPORTING_SAMPLE_EXPORTER_HPP
#define REPORTING_SAMPLE_EXPORTER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/event_log.hpp"
#include "types/sample.hpp"

namespace reporting {

    struct ExportReport {
        std::vector<std::filesystem::path> exported;
        std::size_t failed = 0;
        common::logging::EventLog events;
    };

    // Copies a random handful of evaluated images for eyeballing. Never fails the caller.
    class SampleExporter {
    public:
        static constexpr std::string_view stage_ = "export";
        static constexpr std::size_t default_count_ = 3;

        /*
         * Picks `count` samples with a prediction uniformly without replacement (all of them if fewer) and copies
         * each to folder/sample{i}_gt_{truth}_pred_{prediction}{.ext}, i starting at 1.
         */
        [[nodiscard]] static ExportReport exportSamples(const Samples &samples, const std::filesystem::path &folder,
                                                        std::size_t count, std::uint32_t seed);

        // Export name for the index-th (1-based) selected sample.
        [[nodiscard]] static std::string fileName(std::size_t index, const Sample &sample);
    };

} // namespace reporting

#endif // REPORTING_SAMPLE_EXPORTER_HPP
