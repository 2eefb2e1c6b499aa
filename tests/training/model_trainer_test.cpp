// tests/training/model_trainer_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "training/model_trainer.hpp"
#include "test_utils.hpp"

using namespace training;
using ::testing::HasSubstr;

class CommandTrainerTest : public ::testing::Test {
protected:
    test_utils::TemporaryDirectory root;

    [[nodiscard]] CommandTrainer::Options options(const std::string &command) const {
        CommandTrainer::Options options;
        options.command = command;
        options.model_name = "model.onnx";
        options.classifier.labels_path = test_utils::touch(root / "labels.txt", "cat\ndog\n");
        return options;
    }
};

TEST_F(CommandTrainerTest, ExpandsPlaceholders) {
    const auto command = CommandTrainer::expand("train.py --train {train} --val {val} --out {output} -m {model}",
                                                "/tmp/train_data", "/tmp/val_data", "/out", "/out/model.onnx");
    EXPECT_EQ(command, "train.py --train /tmp/train_data --val /tmp/val_data --out /out -m /out/model.onnx");
}

TEST_F(CommandTrainerTest, MalformedCommandIsTrainingError) {
    EXPECT_THROW(static_cast<void>(CommandTrainer::expand("train.py {unknown}", "a", "b", "c", "d")), TrainingError);
    EXPECT_THROW(static_cast<void>(CommandTrainer::expand("train.py {train", "a", "b", "c", "d")), TrainingError);
}

TEST_F(CommandTrainerTest, RequiresCommand) {
    EXPECT_THROW(CommandTrainer(options("")), std::invalid_argument);
}

TEST_F(CommandTrainerTest, NonZeroExitIsTrainingError) {
    CommandTrainer trainer(options("exit 3"));
    try {
        static_cast<void>(trainer.train(root / "train", root / "val", root / "output"));
        FAIL() << "Expected TrainingError";
    } catch (const TrainingError &e) {
        EXPECT_THAT(e.what(), HasSubstr("failed with status"));
    }
}

TEST_F(CommandTrainerTest, MissingModelIsTrainingError) {
    CommandTrainer trainer(options("true"));
    try {
        static_cast<void>(trainer.train(root / "train", root / "val", root / "output"));
        FAIL() << "Expected TrainingError";
    } catch (const TrainingError &e) {
        EXPECT_THAT(e.what(), HasSubstr("not found"));
    }
    EXPECT_TRUE(std::filesystem::is_directory(root / "output"));
}

TEST_F(CommandTrainerTest, UnloadableModelIsTrainingError) {
    CommandTrainer trainer(options("echo garbage > {model}"));
    try {
        static_cast<void>(trainer.train(root / "train", root / "val", root / "output"));
        FAIL() << "Expected TrainingError";
    } catch (const TrainingError &e) {
        EXPECT_THAT(e.what(), HasSubstr("could not be loaded"));
    }
    EXPECT_TRUE(std::filesystem::exists(root / "output" / "model.onnx"));
}
