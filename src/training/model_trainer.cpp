// File: training/model_trainer.cpp

#include "training/model_trainer.hpp"

#include <cstdlib>

#include <fmt/format.h>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/timer.hpp"

namespace training {

    CommandTrainer::CommandTrainer(Options options) : options_(std::move(options)) {
        if (options_.command.empty()) {
            throw std::invalid_argument("CommandTrainer requires a training command");
        }
        if (options_.model_name.empty()) {
            throw std::invalid_argument("CommandTrainer requires a model file name");
        }
    }

    std::string CommandTrainer::expand(const std::string &command, const std::filesystem::path &train_root,
                                       const std::filesystem::path &val_root,
                                       const std::filesystem::path &output_directory,
                                       const std::filesystem::path &model_path) {
        try {
            return fmt::format(fmt::runtime(command), fmt::arg("train", train_root.string()),
                               fmt::arg("val", val_root.string()), fmt::arg("output", output_directory.string()),
                               fmt::arg("model", model_path.string()));
        } catch (const fmt::format_error &e) {
            throw TrainingError(fmt::format("Invalid training command '{}': {}", command, e.what()));
        }
    }

    std::shared_ptr<inference::ClassifierPort> CommandTrainer::train(const std::filesystem::path &train_root,
                                                                     const std::filesystem::path &val_root,
                                                                     const std::filesystem::path &output_directory) {
        try {
            common::io::createDirectory(output_directory);
        } catch (const std::runtime_error &e) {
            throw TrainingError(fmt::format("Output directory unavailable: {}", e.what()));
        }

        const auto model_path = output_directory / options_.model_name;
        const auto command = expand(options_.command, train_root, val_root, output_directory, model_path);

        LOG_INFO("Running training command: {}", command);
        Timer timer("training");
        const int status = std::system(command.c_str());
        timer.stop();

        if (status != 0) {
            LOG_ERROR("Training command exited with status {}", status);
            throw TrainingError(fmt::format("Training command '{}' failed with status {}", command, status));
        }
        if (!std::filesystem::is_regular_file(model_path)) {
            LOG_ERROR("Training finished but no model was written to {}", model_path.string());
            throw TrainingError(fmt::format("Trained model '{}' not found", model_path.string()));
        }

        auto classifier_options = options_.classifier;
        classifier_options.model_path = model_path;
        try {
            return std::make_shared<inference::DnnClassifier>(std::move(classifier_options));
        } catch (const std::runtime_error &e) {
            throw TrainingError(fmt::format("Trained model '{}' could not be loaded: {}", model_path.string(),
                                            e.what()));
        }
    }

} // namespace training
