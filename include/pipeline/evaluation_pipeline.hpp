// File: pipeline/evaluation_pipeline.hpp

#ifndef PIPELINE_EVALUATION_PIPELINE_HPP
#define PIPELINE_EVALUATION_PIPELINE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/event_log.hpp"
#include "evaluation/metrics.hpp"
#include "inference/classifier.hpp"
#include "reporting/report_generator.hpp"
#include "reporting/sample_exporter.hpp"
#include "types/errors.hpp"
#include "types/sample.hpp"

namespace pipeline {

    enum class PipelineState { Idle, Indexed, Inferred, Aggregated, Reported };

    std::string_view toString(PipelineState state) noexcept;

    // A run-level failure. `stage` is the state the run could not reach.
    class PipelineError : public std::runtime_error {
    public:
        PipelineError(PipelineState stage, std::filesystem::path path, const std::string &cause);

        [[nodiscard]] PipelineState stage() const noexcept { return stage_; }
        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    private:
        PipelineState stage_;
        std::filesystem::path path_;
    };

    struct PipelineOptions {
        std::filesystem::path dataset_root;
        std::filesystem::path output_directory;
        std::size_t sample_count = reporting::SampleExporter::default_count_;
        std::uint32_t seed = 0;
        bool parallel = false;
        std::string report_title = "Zero-Shot Classification Report";
        std::string report_name = "report.html";
        std::string matrix_name = "confusion_matrix.csv";
        std::string metrics_name = "metrics.json";
        bool export_samples = true;
    };

    struct PipelineResult {
        PipelineState state = PipelineState::Idle;
        std::size_t evaluated = 0;
        std::size_t skipped = 0;
        Samples samples; // every indexed sample, predictions set where inference succeeded
        std::vector<InferenceError> inference_failures;
        ::evaluation::Evaluation evaluation;
        std::vector<std::filesystem::path> exported;
        reporting::ReportArtifacts artifacts;
        reporting::ReportOutcome report;
        common::logging::EventLog events;
    };

    /*
     * Indexed -> Inferred -> Aggregated -> Reported.
     * Images the classifier cannot handle are dropped from the metrics and counted as skipped. An unreadable
     * dataset or a run without a single classified image raises PipelineError.
     */
    class EvaluationPipeline {
    public:
        EvaluationPipeline(std::shared_ptr<inference::ClassifierPort> classifier, PipelineOptions options);

        // Indexes options.dataset_root and evaluates every image found.
        [[nodiscard]] PipelineResult run();

        // Evaluates samples that were indexed elsewhere (e.g. a held-out split).
        [[nodiscard]] PipelineResult evaluate(Samples samples);

        [[nodiscard]] PipelineState state() const noexcept { return state_; }
        [[nodiscard]] const PipelineOptions &options() const noexcept { return options_; }

        [[nodiscard]] reporting::ReportArtifacts artifacts() const;

    private:
        std::shared_ptr<inference::ClassifierPort> classifier_;
        PipelineOptions options_;
        PipelineState state_ = PipelineState::Idle;

        void advance(PipelineState next, PipelineResult &result);
        void infer(PipelineResult &result) const;
        void aggregate(PipelineResult &result) const;
        void report(PipelineResult &result) const;
    };

} // namespace pipeline

#endif // PIPELINE_EVALUATION_PIPELINE_HPP
