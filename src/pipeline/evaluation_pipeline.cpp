// File: pipeline/evaluation_pipeline.cpp

#include "pipeline/evaluation_pipeline.hpp"

#include <algorithm>
#include <execution>
#include <numeric>
#include <optional>

#include <fmt/format.h>

#include "common/formatting/fmt_metrics.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "dataset/indexer.hpp"

namespace pipeline {

    namespace {
        constexpr std::string_view inference_stage_ = "inference";
        constexpr std::string_view aggregation_stage_ = "aggregation";
        constexpr std::string_view reporting_stage_ = "reporting";
    } // namespace

    std::string_view toString(const PipelineState state) noexcept {
        switch (state) {
            case PipelineState::Idle:
                return "Idle";
            case PipelineState::Indexed:
                return "Indexed";
            case PipelineState::Inferred:
                return "Inferred";
            case PipelineState::Aggregated:
                return "Aggregated";
            case PipelineState::Reported:
                return "Reported";
        }
        return "Unknown";
    }

    PipelineError::PipelineError(const PipelineState stage, std::filesystem::path path, const std::string &cause) :
        std::runtime_error(fmt::format("Evaluation failed before reaching '{}' ({}): {}", toString(stage),
                                       path.string(), cause)),
        stage_(stage), path_(std::move(path)) {}

    EvaluationPipeline::EvaluationPipeline(std::shared_ptr<inference::ClassifierPort> classifier,
                                           PipelineOptions options) :
        classifier_(std::move(classifier)), options_(std::move(options)) {
        if (!classifier_) {
            throw std::invalid_argument("EvaluationPipeline requires a classifier");
        }
    }

    reporting::ReportArtifacts EvaluationPipeline::artifacts() const {
        reporting::ReportArtifacts artifacts;
        artifacts.csv = options_.output_directory / options_.matrix_name;
        artifacts.html = options_.output_directory / options_.report_name;
        artifacts.json = options_.output_directory / options_.metrics_name;
        if (options_.export_samples) {
            artifacts.sample_folder = options_.output_directory / "samples";
        }
        return artifacts;
    }

    void EvaluationPipeline::advance(const PipelineState next, PipelineResult &result) {
        state_ = next;
        result.state = next;
        LOG_DEBUG("Pipeline state: {}", toString(next));
    }

    PipelineResult EvaluationPipeline::run() {
        state_ = PipelineState::Idle;
        Timer timer("indexing");

        dataset::DatasetIndex index;
        try {
            index = dataset::DatasetIndexer::index(options_.dataset_root);
        } catch (const DatasetReadError &e) {
            LOG_ERROR("Dataset indexing failed: {}", e.what());
            throw PipelineError(PipelineState::Indexed, e.path(), e.what());
        }
        timer.stop();

        PipelineResult result = evaluate(std::move(index.samples));
        common::logging::EventLog events = std::move(index.events);
        events.append(result.events);
        result.events = std::move(events);
        return result;
    }

    PipelineResult EvaluationPipeline::evaluate(Samples samples) {
        PipelineResult result;
        result.samples = std::move(samples);
        result.artifacts = artifacts();

        // Predictions left over from an earlier run would be counted without ever being classified here.
        const auto stale = std::ranges::count_if(result.samples, [](const Sample &sample) {
            return sample.hasPrediction();
        });
        if (stale > 0) {
            result.events.warn(inference_stage_, "Discarding {} prediction(s) already attached to the samples", stale);
            std::ranges::for_each(result.samples, [](Sample &sample) { sample.clearPrediction(); });
        }
        advance(PipelineState::Indexed, result);

        {
            Timer timer("inference");
            infer(result);
        }
        advance(PipelineState::Inferred, result);

        {
            Timer timer("aggregation");
            aggregate(result);
        }
        advance(PipelineState::Aggregated, result);

        {
            Timer timer("reporting");
            report(result);
        }
        advance(PipelineState::Reported, result);

        LOG_INFO("Evaluation finished: {} evaluated, {} skipped, {}", result.evaluated, result.skipped,
                 result.evaluation.metrics);
        return result;
    }

    void EvaluationPipeline::infer(PipelineResult &result) const {
        auto &samples = result.samples;
        std::vector<std::optional<InferenceError>> failures(samples.size());

        // Each index is owned by exactly one call, so slots are written once and need no locking.
        const auto classify = [this, &samples, &failures](const std::size_t i) {
            const auto &path = samples[i].getImagePath();
            try {
                samples[i].setPrediction(classifier_->predict(path));
            } catch (const InferenceError &e) {
                failures[i].emplace(e);
            } catch (const std::exception &e) {
                failures[i].emplace(path, e.what());
            }
        };

        std::vector<std::size_t> indices(samples.size());
        std::iota(indices.begin(), indices.end(), std::size_t{0});

        const bool parallel = options_.parallel && classifier_->isThreadSafe();
        if (options_.parallel && !parallel) {
            result.events.warn(inference_stage_, "Classifier is not thread-safe, running inference sequentially");
        }
        if (parallel) {
            std::for_each(std::execution::par, indices.begin(), indices.end(), classify);
        } else {
            std::ranges::for_each(indices, classify);
        }

        for (std::size_t i = 0; i < samples.size(); ++i) {
            if (failures[i]) {
                result.events.warn(inference_stage_, "Skipping sample: {}", failures[i]->what());
                result.inference_failures.push_back(std::move(*failures[i]));
                continue;
            }
            LOG_DEBUG("GT: {} | Pred: {}", samples[i].getGroundTruth(), *samples[i].getPrediction());
            ++result.evaluated;
        }
        result.skipped = result.inference_failures.size();

        result.events.info(inference_stage_, "Classified {} of {} images ({} skipped)", result.evaluated,
                           samples.size(), result.skipped);
    }

    void EvaluationPipeline::aggregate(PipelineResult &result) const {
        std::vector<ClassLabel> ground_truths;
        std::vector<ClassLabel> predictions;
        ground_truths.reserve(result.evaluated);
        predictions.reserve(result.evaluated);

        // Index order, independent of the order in which predictions completed.
        for (const auto &sample: result.samples) {
            if (sample.hasPrediction()) {
                ground_truths.push_back(sample.getGroundTruth());
                predictions.push_back(*sample.getPrediction());
            }
        }

        try {
            result.evaluation = evaluation::MetricsEngine::evaluate(ground_truths, predictions);
        } catch (const MetricsInputError &e) {
            result.events.error(aggregation_stage_, "{}", e.what());
            throw PipelineError(PipelineState::Aggregated, options_.dataset_root, e.what());
        }

        for (const auto &label: result.evaluation.per_label) {
            LOG_DEBUG("{}", label);
        }
        result.events.info(aggregation_stage_, "Metrics over {} samples: {}", result.evaluation.sample_count,
                           result.evaluation.metrics);
    }

    void EvaluationPipeline::report(PipelineResult &result) const {
        const auto &artifacts = result.artifacts;

        // The gallery lists the whole folder, so exports from earlier runs are removed first.
        if (artifacts.sample_folder) {
            try {
                common::io::removeDirectory(*artifacts.sample_folder);
            } catch (const std::runtime_error &e) {
                result.events.warn(reporting_stage_, "Could not clear sample folder: {}", e.what());
            }
        }

        if (artifacts.sample_folder && options_.sample_count > 0) {
            auto exported = reporting::SampleExporter::exportSamples(result.samples, *artifacts.sample_folder,
                                                                     options_.sample_count, options_.seed);
            result.exported = std::move(exported.exported);
            result.events.append(exported.events);
        }

        reporting::ReportGenerator::Options report_options;
        report_options.title = options_.report_title;
        report_options.include_gallery = artifacts.sample_folder.has_value();
        const reporting::ReportGenerator generator(report_options);

        result.report = generator.generate(result.evaluation, {result.evaluated, result.skipped}, artifacts);
        result.events.append(result.report.events);
    }

} // namespace pipeline
