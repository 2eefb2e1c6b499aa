// File: inference/dnn_classifier.hpp

#ifndef INFERENCE_DNN_CLASSIFIER_HPP
#define INFERENCE_DNN_CLASSIFIER_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "inference/classifier.hpp"

namespace inference {

    /*
     * ClassifierPort backed by cv::dnn. The network must output one score per class; the labels file lists one
     * class name per line in output order.
     */
    class DnnClassifier final : public ClassifierPort {
    public:
        struct Options {
            std::filesystem::path model_path;
            std::filesystem::path labels_path;
            cv::Size input_size{224, 224};
            double scale = 1.0 / 255.0;
            cv::Scalar mean{0.0, 0.0, 0.0};
            bool swap_rb = true;
        };

        // Loads the model and labels named in options. Throws std::runtime_error when either cannot be read.
        explicit DnnClassifier(Options options);

        // Uses an already built network; model_path and labels_path in options are ignored.
        DnnClassifier(cv::dnn::Net net, std::vector<ClassLabel> labels, Options options);

        [[nodiscard]] ClassLabel predict(const std::filesystem::path &image_path) override;

        [[nodiscard]] bool isThreadSafe() const noexcept override { return true; }

        [[nodiscard]] const std::vector<ClassLabel> &labels() const noexcept { return labels_; }

        // One label per line; blank lines are ignored and trailing whitespace is trimmed.
        [[nodiscard]] static std::vector<ClassLabel> loadLabels(const std::filesystem::path &labels_path);

    private:
        Options options_;
        std::vector<ClassLabel> labels_;
        cv::dnn::Net net_;
        std::mutex mutex_;

        [[nodiscard]] static cv::dnn::Net loadModel(const std::filesystem::path &model_path);

        void configureBackend();
    };

} // namespace inference

#endif // INFERENCE_DNN_CLASSIFIER_HPP
