// tests/inference/dnn_classifier_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <execution>
#include <numeric>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "inference/dnn_classifier.hpp"
#include "test_utils.hpp"

using namespace inference;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class DnnClassifierTest : public ::testing::Test {
protected:
    test_utils::TemporaryDirectory root;

    // One Flatten layer: a 1x1 input blob becomes its three channel values, so the colour decides the class.
    [[nodiscard]] static cv::dnn::Net channelNet() {
        cv::dnn::LayerParams params;
        params.name = "scores";
        params.type = "Flatten";
        cv::dnn::Net net;
        net.addLayerToPrev(params.name, params.type, params);
        return net;
    }

    [[nodiscard]] static DnnClassifier::Options rawPixels() {
        DnnClassifier::Options options;
        options.input_size = cv::Size(1, 1);
        options.scale = 1.0;
        options.swap_rb = false;
        return options;
    }

    // Solid BGR image written losslessly.
    [[nodiscard]] std::filesystem::path solidImage(const std::string &name, const cv::Scalar &bgr) const {
        const auto path = root / name;
        const cv::Mat image(4, 4, CV_8UC3, bgr);
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("could not write test image " + path.string());
        }
        return path;
    }
};

TEST_F(DnnClassifierTest, LabelsAreTrimmedAndBlankLinesSkipped) {
    const auto labels_file = test_utils::touch(root / "labels.txt", "cat\r\n\n  \ngolden retriever  \ndog\n");
    EXPECT_THAT(DnnClassifier::loadLabels(labels_file), ElementsAre("cat", "golden retriever", "dog"));
}

TEST_F(DnnClassifierTest, MissingLabelsFileThrows) {
    EXPECT_THROW(static_cast<void>(DnnClassifier::loadLabels(root / "absent.txt")), std::runtime_error);
}

TEST_F(DnnClassifierTest, EmptyLabelsFileThrows) {
    const auto labels_file = test_utils::touch(root / "labels.txt", "\n\n");
    EXPECT_THROW(static_cast<void>(DnnClassifier::loadLabels(labels_file)), std::runtime_error);
}

TEST_F(DnnClassifierTest, MissingModelThrows) {
    DnnClassifier::Options options;
    options.labels_path = test_utils::touch(root / "labels.txt", "cat\ndog\n");
    options.model_path = root / "absent.onnx";

    EXPECT_THROW(DnnClassifier classifier(options), std::runtime_error);
}

TEST_F(DnnClassifierTest, DefaultsMatchCommonImageNetExports) {
    const DnnClassifier::Options options;
    EXPECT_EQ(options.input_size, cv::Size(224, 224));
    EXPECT_DOUBLE_EQ(options.scale, 1.0 / 255.0);
    EXPECT_TRUE(options.swap_rb);
}

TEST_F(DnnClassifierTest, PredictsLabelWithHighestScore) {
    DnnClassifier classifier(channelNet(), {"cat", "dog", "bird"}, rawPixels());

    EXPECT_EQ(classifier.predict(solidImage("red.png", cv::Scalar(10, 30, 200))), "bird");
    EXPECT_EQ(classifier.predict(solidImage("green.png", cv::Scalar(10, 200, 30))), "dog");
    EXPECT_EQ(classifier.predict(solidImage("blue.png", cv::Scalar(200, 30, 10))), "cat");
}

TEST_F(DnnClassifierTest, SwapRbReordersChannelsBeforeScoring) {
    auto options = rawPixels();
    options.swap_rb = true;
    DnnClassifier classifier(channelNet(), {"cat", "dog", "bird"}, options);

    EXPECT_EQ(classifier.predict(solidImage("red.png", cv::Scalar(10, 30, 200))), "cat");
}

TEST_F(DnnClassifierTest, ScoreBeyondLabelsIsInferenceError) {
    DnnClassifier classifier(channelNet(), {"cat", "dog"}, rawPixels());
    const auto image = solidImage("red.png", cv::Scalar(10, 30, 200));

    try {
        static_cast<void>(classifier.predict(image));
        FAIL() << "Expected InferenceError";
    } catch (const InferenceError &e) {
        EXPECT_EQ(e.path(), image);
        EXPECT_THAT(e.what(), HasSubstr("outside of 2 labels"));
    }
}

TEST_F(DnnClassifierTest, UndecodableImageIsInferenceError) {
    DnnClassifier classifier(channelNet(), {"cat", "dog", "bird"}, rawPixels());
    const auto broken = test_utils::touch(root / "broken.jpg", "not a jpeg");
    EXPECT_THROW(static_cast<void>(classifier.predict(broken)), InferenceError);
    EXPECT_THROW(static_cast<void>(classifier.predict(root / "absent.png")), InferenceError);
}

TEST_F(DnnClassifierTest, ConcurrentPredictionsKeepTheirOwnScores) {
    DnnClassifier classifier(channelNet(), {"cat", "dog", "bird"}, rawPixels());
    ASSERT_TRUE(classifier.isThreadSafe());

    const std::vector<std::filesystem::path> images{solidImage("blue.png", cv::Scalar(200, 30, 10)),
                                                    solidImage("green.png", cv::Scalar(10, 200, 30)),
                                                    solidImage("red.png", cv::Scalar(10, 30, 200))};
    const std::vector<ClassLabel> expected{"cat", "dog", "bird"};

    std::vector<std::size_t> indices(300);
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    std::vector<ClassLabel> predictions(indices.size());
    std::for_each(std::execution::par, indices.begin(), indices.end(), [&](const std::size_t i) {
        predictions[i] = classifier.predict(images[i % images.size()]);
    });

    for (std::size_t i = 0; i < predictions.size(); ++i) {
        EXPECT_EQ(predictions[i], expected[i % expected.size()]) << "prediction " << i;
    }
}

TEST_F(DnnClassifierTest, RequiresNetworkAndLabels) {
    EXPECT_THROW(DnnClassifier(cv::dnn::Net(), {"cat"}, rawPixels()), std::invalid_argument);
    EXPECT_THROW(DnnClassifier(channelNet(), {}, rawPixels()), std::invalid_argument);
}
