// File: training/training_workflow.cpp

#include "training/training_workflow.hpp"

#include <fmt/format.h>

#include "common/formatting/fmt_metrics.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "dataset/indexer.hpp"

namespace training {

    TrainingWorkflow::TrainingWorkflow(std::shared_ptr<ModelTrainer> trainer, TrainingOptions options) :
        trainer_(std::move(trainer)), options_(std::move(options)) {
        if (!trainer_) {
            throw std::invalid_argument("TrainingWorkflow requires a trainer");
        }
        options_.ratios.validate();
    }

    dataset::SplitDestinations TrainingWorkflow::destinations() const {
        return {options_.work_directory / "train_data", options_.work_directory / "val_data",
                options_.work_directory / "test_data"};
    }

    void TrainingWorkflow::prepareWorkDirectories() const {
        const auto [train, val, test] = destinations();
        for (const auto &directory: {train, val, test}) {
            try {
                common::io::removeDirectory(directory);
                common::io::createDirectory(directory);
            } catch (const std::runtime_error &e) {
                LOG_ERROR("Work directory {} could not be prepared: {}", directory.string(), e.what());
                throw TrainingError(fmt::format("Work directory '{}' unavailable: {}", directory.string(), e.what()));
            }
        }
    }

    void TrainingWorkflow::removeWorkDirectories() const noexcept {
        if (options_.keep_work_directories) {
            LOG_INFO("Keeping split directories under {}", options_.work_directory.string());
            return;
        }

        const auto [train, val, test] = destinations();
        for (const auto &directory: {train, val, test}) {
            std::error_code ec;
            std::filesystem::remove_all(directory, ec);
            if (ec) {
                LOG_WARN("Failed to remove {}: {}", directory.string(), ec.message());
            }
        }
    }

    TrainingResult TrainingWorkflow::run() {
        try {
            auto result = execute();
            removeWorkDirectories();
            return result;
        } catch (const std::exception &e) {
            LOG_ERROR("Training workflow failed: {}", e.what());
            removeWorkDirectories();
            throw;
        }
    }

    TrainingResult TrainingWorkflow::execute() {
        TrainingResult result;
        prepareWorkDirectories();

        dataset::DatasetIndex index;
        try {
            index = dataset::DatasetIndexer::index(options_.dataset_root);
        } catch (const DatasetReadError &e) {
            throw pipeline::PipelineError(pipeline::PipelineState::Indexed, e.path(), e.what());
        }
        result.events.append(index.events);

        const auto splits = destinations();
        const dataset::DatasetSplitter splitter(options_.ratios);
        result.split = splitter.split(dataset::DatasetIndexer::groupByClass(index), splits, options_.seed);
        result.events.append(result.split.events);

        std::shared_ptr<inference::ClassifierPort> classifier;
        {
            Timer timer("model training");
            classifier = trainer_->train(splits.train, splits.val, options_.output_directory);
        }
        if (!classifier) {
            throw TrainingError("Trainer returned no classifier");
        }
        result.events.info(stage_, "Model trained on {}", splits.train.string());

        pipeline::PipelineOptions evaluation_options;
        evaluation_options.dataset_root = splits.test;
        evaluation_options.output_directory = options_.output_directory;
        evaluation_options.seed = options_.seed;
        evaluation_options.parallel = options_.parallel;
        evaluation_options.report_title = options_.report_title;
        evaluation_options.report_name = options_.report_name;
        evaluation_options.metrics_name = "training_metrics.json";
        evaluation_options.export_samples = false;

        pipeline::EvaluationPipeline evaluation(std::move(classifier), std::move(evaluation_options));
        result.evaluation = evaluation.run();
        result.events.append(result.evaluation.events);

        LOG_INFO("Held-out evaluation: {}", result.evaluation.evaluation.metrics);
        return result;
    }

} // namespace training
