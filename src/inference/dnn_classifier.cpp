// File: inference/dnn_classifier.cpp

#include "inference/dnn_classifier.hpp"

#include <fstream>
#include <stdexcept>

#include "common/io/image.hpp"
#include "common/logging/logger.hpp"

namespace inference {

    DnnClassifier::DnnClassifier(Options options) :
        DnnClassifier(loadModel(options.model_path), loadLabels(options.labels_path), options) {}

    DnnClassifier::DnnClassifier(cv::dnn::Net net, std::vector<ClassLabel> labels, Options options) :
        options_(std::move(options)), labels_(std::move(labels)), net_(std::move(net)) {
        if (net_.empty()) {
            throw std::invalid_argument("DnnClassifier requires a network with at least one layer");
        }
        if (labels_.empty()) {
            throw std::invalid_argument("DnnClassifier requires at least one label");
        }

        configureBackend();
        LOG_INFO("Classifier ready: {} labels, input {}x{}", labels_.size(), options_.input_size.width,
                 options_.input_size.height);
    }

    cv::dnn::Net DnnClassifier::loadModel(const std::filesystem::path &model_path) {
        LOG_INFO("Loading classifier model: {}", model_path.string());
        cv::dnn::Net net;
        try {
            net = cv::dnn::readNet(model_path.string());
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV could not load model {}: {}", model_path.string(), e.what());
            throw std::runtime_error(fmt::format("Failed to load model: {}", model_path.string()));
        }
        if (net.empty()) {
            throw std::runtime_error(fmt::format("Failed to load model: {}", model_path.string()));
        }
        return net;
    }

    std::vector<ClassLabel> DnnClassifier::loadLabels(const std::filesystem::path &labels_path) {
        std::ifstream file(labels_path);
        if (!file) {
            LOG_ERROR("Failed to open labels file: {}", labels_path.string());
            throw std::runtime_error(fmt::format("Failed to open labels file: {}", labels_path.string()));
        }

        std::vector<ClassLabel> labels;
        std::string line;
        while (std::getline(file, line)) {
            const auto end = line.find_last_not_of(" \t\r\n");
            if (end == std::string::npos) {
                continue;
            }
            labels.push_back(line.substr(0, end + 1));
        }

        if (labels.empty()) {
            throw std::runtime_error(fmt::format("Labels file is empty: {}", labels_path.string()));
        }
        return labels;
    }

    void DnnClassifier::configureBackend() {
        // Plain OpenCV CPU backend; CUDA builds of OpenCV are not assumed.
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    }

    ClassLabel DnnClassifier::predict(const std::filesystem::path &image_path) {
        cv::Mat image;
        try {
            image = common::io::image::readImage(image_path);
        } catch (const std::runtime_error &e) {
            throw InferenceError(image_path, e.what());
        }

        cv::Mat scores;
        try {
            const cv::Mat blob = cv::dnn::blobFromImage(image, options_.scale, options_.input_size, options_.mean,
                                                        options_.swap_rb, false, CV_32F);

            // forward() returns a view of the network's output blob, so it is copied before the lock is released.
            std::lock_guard lock(mutex_);
            net_.setInput(blob);
            scores = net_.forward().reshape(1, 1).clone();
        } catch (const cv::Exception &e) {
            throw InferenceError(image_path, e.what());
        }

        cv::Point class_id;
        double score = 0.0;
        cv::minMaxLoc(scores, nullptr, &score, nullptr, &class_id);

        if (class_id.x < 0 || static_cast<std::size_t>(class_id.x) >= labels_.size()) {
            throw InferenceError(image_path, fmt::format("class index {} outside of {} labels", class_id.x,
                                                         labels_.size()));
        }

        LOG_TRACE("{} -> {} ({:.4f})", image_path.string(), labels_[class_id.x], score);
        return labels_[class_id.x];
    }

} // namespace inference
