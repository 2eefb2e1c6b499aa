// File: executor.cpp

#include "executor.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "common/formatting/fmt_metrics.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

std::once_flag Executor::seed_flag_;
std::uint32_t Executor::seed_ = 0;

Executor::Task Executor::parseTask(const std::string_view name) {
    if (name == "evaluate") {
        return Task::Evaluate;
    }
    if (name == "train") {
        return Task::Train;
    }
    if (name == "evaluate_and_train") {
        return Task::EvaluateAndTrain;
    }
    throw std::invalid_argument(
            fmt::format("Unknown task '{}', expected evaluate, train or evaluate_and_train", name));
}

bool Executor::allInputsSelected() { return allInputsSelected(config::Configuration::getInstance()); }

bool Executor::allInputsSelected(const config::Configuration &configuration) {
    bool selected = true;
    for (const auto *key: {"paths.model", "paths.dataset", "paths.output"}) {
        if (configuration.get(key, "").empty()) {
            LOG_ERROR("Missing required configuration value '{}'", key);
            selected = false;
        }
    }
    return selected;
}

std::uint32_t Executor::seed() {
    std::call_once(seed_flag_, [] {
        if (const auto configured = config::get<std::uint32_t>("random.seed")) {
            seed_ = *configured;
            LOG_INFO("Using configured seed {}", seed_);
        } else {
            seed_ = std::random_device{}();
            LOG_INFO("No random.seed configured, using seed {}", seed_);
        }
    });
    return seed_;
}

inference::DnnClassifier::Options Executor::classifierOptions() {
    inference::DnnClassifier::Options options;
    options.model_path = config::get("paths.model", "");
    options.labels_path = config::get("paths.labels", "labels.txt");
    options.input_size = cv::Size(config::get("classifier.input_width", 224), config::get("classifier.input_height", 224));
    options.scale = config::get("classifier.scale", 1.0 / 255.0);
    options.swap_rb = config::get("classifier.swap_rb", true);

    const auto mean = config::get("classifier.mean", std::vector<double>{0.0, 0.0, 0.0});
    if (mean.size() != 3) {
        throw std::invalid_argument(fmt::format("classifier.mean needs 3 values, got {}", mean.size()));
    }
    options.mean = cv::Scalar(mean[0], mean[1], mean[2]);
    return options;
}

pipeline::PipelineOptions Executor::evaluationOptions() {
    pipeline::PipelineOptions options;
    options.dataset_root = config::get("paths.dataset", "");
    options.output_directory = config::get("paths.output", "");
    options.sample_count = static_cast<std::size_t>(std::max(0, config::get("evaluation.sample_count", 3)));
    options.parallel = config::get("evaluation.parallel", false);
    options.report_title = config::get("evaluation.report_title", "Zero-Shot Classification Report");
    options.seed = seed();
    return options;
}

training::TrainingOptions Executor::trainingOptions() {
    training::TrainingOptions options;
    options.dataset_root = config::get("paths.dataset", "");
    options.output_directory = config::get("paths.output", "");
    if (const auto work = config::get<std::string>("split.work_directory"); work && !work->empty()) {
        options.work_directory = *work;
    }
    options.ratios.train = config::get("split.train_ratio", 0.6);
    options.ratios.val = config::get("split.val_ratio", 0.2);
    options.keep_work_directories = config::get("split.keep", false);
    options.parallel = config::get("evaluation.parallel", false);
    options.seed = seed();
    return options;
}

training::CommandTrainer::Options Executor::trainerOptions() {
    training::CommandTrainer::Options options;
    options.command = config::get("training.command", "");
    options.model_name = config::get("training.model_name", "model.onnx");
    options.classifier = classifierOptions();
    return options;
}

pipeline::PipelineResult Executor::evaluate() {
    LOG_INFO("Starting evaluation.");
    auto classifier = std::make_shared<inference::DnnClassifier>(classifierOptions());
    pipeline::EvaluationPipeline evaluation(std::move(classifier), evaluationOptions());
    auto result = evaluation.run();

    if (!result.report.ok()) {
        LOG_WARN("{} report artifact(s) could not be written", result.report.failures.size());
    }
    LOG_INFO("Evaluation report: {}", result.artifacts.html.string());
    return result;
}

training::TrainingResult Executor::train() {
    LOG_INFO("Starting training.");
    auto trainer = std::make_shared<training::CommandTrainer>(trainerOptions());
    training::TrainingWorkflow workflow(std::move(trainer), trainingOptions());
    auto result = workflow.run();

    if (!result.split.failures.empty()) {
        LOG_WARN("{} file(s) could not be copied into the split", result.split.failures.size());
    }
    LOG_INFO("Training report: {}", result.evaluation.artifacts.html.string());
    return result;
}

void Executor::execute(const Task task) {
    switch (task) {
        case Task::Evaluate:
            evaluate();
            break;
        case Task::Train:
            train();
            break;
        case Task::EvaluateAndTrain:
            evaluate();
            train();
            break;
    }
}
