// File: training/training_workflow.hpp

#ifndef TRAINING_TRAINING_WORKFLOW_HPP
#define TRAINING_TRAINING_WORKFLOW_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "common/logging/event_log.hpp"
#include "dataset/splitter.hpp"
#include "pipeline/evaluation_pipeline.hpp"
#include "training/model_trainer.hpp"

namespace training {

    struct TrainingOptions {
        std::filesystem::path dataset_root;
        std::filesystem::path output_directory;
        std::filesystem::path work_directory = std::filesystem::temp_directory_path();
        dataset::SplitRatios ratios;
        std::uint32_t seed = 0;
        bool keep_work_directories = false;
        bool parallel = false;
        std::string report_title = "Training Report";
        std::string report_name = "training_report.html";
    };

    struct TrainingResult {
        dataset::SplitReport split;
        pipeline::PipelineResult evaluation;
        common::logging::EventLog events;
    };

    /*
     * Split the dataset into {work}/train_data, {work}/val_data and {work}/test_data, train on the first two and
     * evaluate the trained model on the held-out test split. The work directories are removed afterwards unless
     * keep_work_directories is set.
     */
    class TrainingWorkflow {
    public:
        static constexpr std::string_view stage_ = "training";

        TrainingWorkflow(std::shared_ptr<ModelTrainer> trainer, TrainingOptions options);

        [[nodiscard]] TrainingResult run();

        [[nodiscard]] dataset::SplitDestinations destinations() const;

    private:
        std::shared_ptr<ModelTrainer> trainer_;
        TrainingOptions options_;

        void prepareWorkDirectories() const;
        void removeWorkDirectories() const noexcept;
        [[nodiscard]] TrainingResult execute();
    };

} // namespace training

#endif // TRAINING_TRAINING_WORKFLOW_HPP
