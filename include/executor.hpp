// File: executor.hpp

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <cstdint>
#include <mutex>
#include <string_view>

#include "config/configuration.hpp"
#include "inference/dnn_classifier.hpp"
#include "pipeline/evaluation_pipeline.hpp"
#include "training/model_trainer.hpp"
#include "training/training_workflow.hpp"

// Runs the configured task. Everything is read through config::get.
class Executor {
public:
    enum class Task { Evaluate, Train, EvaluateAndTrain };

    // Throws std::invalid_argument for an unknown task name.
    static Task parseTask(std::string_view name);

    // Model, dataset and output paths must all be configured before anything runs.
    [[nodiscard]] static bool allInputsSelected();
    [[nodiscard]] static bool allInputsSelected(const config::Configuration &configuration);

    static void execute(Task task);

    static pipeline::PipelineResult evaluate();
    static training::TrainingResult train();

    [[nodiscard]] static inference::DnnClassifier::Options classifierOptions();
    [[nodiscard]] static pipeline::PipelineOptions evaluationOptions();
    [[nodiscard]] static training::TrainingOptions trainingOptions();
    [[nodiscard]] static training::CommandTrainer::Options trainerOptions();

    // random.seed when configured, otherwise drawn once per process and logged.
    [[nodiscard]] static std::uint32_t seed();

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;
    Executor(Executor &&) = delete;
    Executor &operator=(Executor &&) = delete;
    ~Executor() = default;

    Executor() = delete;

private:
    static std::once_flag seed_flag_;
    static std::uint32_t seed_;
};

#endif // EXECUTOR_HPP
