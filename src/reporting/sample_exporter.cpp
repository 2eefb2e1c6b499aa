// File: reporting/sample_exporter.cpp

#include "reporting/sample_exporter.hpp"

#include <algorithm>
#include <iterator>
#include <random>

#include <fmt/format.h>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace reporting {

    namespace {
        // Predicted labels come from the classifier and may not be valid path components.
        std::string sanitize(std::string label) {
            std::ranges::replace_if(label, [](const char c) { return c == '/' || c == '\\'; }, '_');
            return label;
        }
    } // namespace

    std::string SampleExporter::fileName(const std::size_t index, const Sample &sample) {
        return fmt::format("sample{}_gt_{}_pred_{}{}", index, sanitize(sample.getGroundTruth()),
                           sanitize(sample.getPrediction().value_or("")), sample.getImagePath().extension().string());
    }

    ExportReport SampleExporter::exportSamples(const Samples &samples, const std::filesystem::path &folder,
                                               const std::size_t count, const std::uint32_t seed) {
        ExportReport report;

        Samples candidates;
        std::ranges::copy_if(samples, std::back_inserter(candidates),
                             [](const Sample &sample) { return sample.hasPrediction(); });

        std::mt19937 engine(seed);
        std::shuffle(candidates.begin(), candidates.end(), engine);
        candidates.resize(std::min(count, candidates.size()));

        if (candidates.empty()) {
            report.events.warn(stage_, "No evaluated samples to export");
            return report;
        }

        try {
            common::io::createDirectory(folder);
        } catch (const std::runtime_error &e) {
            report.failed = candidates.size();
            report.events.error(stage_, "Sample folder unavailable, nothing exported: {}", e.what());
            return report;
        }

        for (std::size_t i = 0; i < candidates.size(); ++i) {
            const auto destination = folder / fileName(i + 1, candidates[i]);
            try {
                common::io::copyFile(candidates[i].getImagePath(), destination, true);
                report.exported.push_back(destination);
            } catch (const std::runtime_error &e) {
                ++report.failed;
                report.events.warn(stage_, "Skipped sample {}: {}", candidates[i].getImagePath().string(), e.what());
            }
        }

        report.events.info(stage_, "Exported {} of {} requested samples to {}", report.exported.size(), count,
                           folder.string());
        return report;
    }

} // namespace reporting
