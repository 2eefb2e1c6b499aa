// File: training/model_trainer.hpp

#ifndef TRAINING_MODEL_TRAINER_HPP
#define TRAINING_MODEL_TRAINER_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "inference/classifier.hpp"
#include "inference/dnn_classifier.hpp"
#include "types/errors.hpp"

namespace training {

    class ModelTrainer {
    public:
        virtual ~ModelTrainer() = default;

        // Trains on the given class-partitioned folders and returns a classifier for the resulting model.
        // Throws TrainingError if no usable model is produced.
        [[nodiscard]] virtual std::shared_ptr<inference::ClassifierPort>
        train(const std::filesystem::path &train_root, const std::filesystem::path &val_root,
              const std::filesystem::path &output_directory) = 0;
    };

    /*
     * Delegates training to an external command, e.g. a python script exporting ONNX.
     * Placeholders: {train}, {val}, {output} and {model}. The command must leave the model at {model}.
     */
    class CommandTrainer final : public ModelTrainer {
    public:
        struct Options {
            std::string command;
            std::string model_name = "model.onnx";
            inference::DnnClassifier::Options classifier; // model_path is filled in after training
        };

        explicit CommandTrainer(Options options);

        [[nodiscard]] std::shared_ptr<inference::ClassifierPort>
        train(const std::filesystem::path &train_root, const std::filesystem::path &val_root,
              const std::filesystem::path &output_directory) override;

        [[nodiscard]] static std::string expand(const std::string &command, const std::filesystem::path &train_root,
                                                const std::filesystem::path &val_root,
                                                const std::filesystem::path &output_directory,
                                                const std::filesystem::path &model_path);

    private:
        Options options_;
    };

} // namespace training

#endif // TRAINING_MODEL_TRAINER_HPP
