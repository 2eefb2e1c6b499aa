// File: reporting/report_generator.hpp

#ifndef REPORTING_REPORT_GENERATOR_HPP
#define REPORTING_REPORT_GENERATOR_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/event_log.hpp"
#include "evaluation/metrics.hpp"
#include "types/errors.hpp"

namespace reporting {

    // How many images made it into the metrics, and how many were dropped on the way.
    struct RunSummary {
        std::size_t evaluated = 0;
        std::size_t skipped = 0;
    };

    struct ReportArtifacts {
        std::filesystem::path csv;
        std::filesystem::path html;
        std::optional<std::filesystem::path> json;
        std::optional<std::filesystem::path> sample_folder; // gallery source, referenced relative to the html
    };

    struct ReportOutcome {
        std::vector<std::filesystem::path> written;
        std::vector<ReportWriteError> failures;
        common::logging::EventLog events;

        [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
    };

    class ReportGenerator {
    public:
        static constexpr std::string_view stage_ = "reporting";

        struct Options {
            std::string title = "Zero-Shot Classification Report";
            bool include_gallery = true;
            bool include_per_label = true;
        };

        ReportGenerator();
        explicit ReportGenerator(Options options);

        [[nodiscard]] const Options &options() const noexcept { return options_; }

        // Writes every artifact it can. A failed artifact is logged and recorded, the others are still attempted.
        [[nodiscard]] ReportOutcome generate(const evaluation::Evaluation &evaluation, const RunSummary &summary,
                                             const ReportArtifacts &artifacts) const;

        // "GroundTruth/Predicted,<labels...>" followed by one row of counts per ground-truth label.
        [[nodiscard]] static std::string renderCsv(const evaluation::ConfusionMatrix &matrix);

        [[nodiscard]] std::string renderHtml(const evaluation::Evaluation &evaluation, const RunSummary &summary,
                                             const ReportArtifacts &artifacts) const;

        [[nodiscard]] static std::string renderJson(const evaluation::Evaluation &evaluation,
                                                    const RunSummary &summary);

        // Image files of the folder in name order; empty when the folder is missing.
        [[nodiscard]] static std::vector<std::filesystem::path> galleryImages(const std::filesystem::path &folder);

        [[nodiscard]] static std::string escape(std::string_view text);

    private:
        Options options_;

        static void write(const std::filesystem::path &path, const std::string &content, ReportOutcome &outcome);
    };

} // namespace reporting

#endif // REPORTING_REPORT_GENERATOR_HPP
