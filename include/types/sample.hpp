// File: types/sample.hpp

#ifndef TYPE_SAMPLE_HPP
#define TYPE_SAMPLE_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

// A labeled image. The ground truth is the name of the class folder the image lives in.
class Sample {
public:
    Sample() = default;

    Sample(std::filesystem::path image_path, std::string ground_truth) :
        image_path_(std::move(image_path)), ground_truth_(std::move(ground_truth)) {}

    Sample(const Sample &) = default;
    Sample &operator=(const Sample &) = default;
    Sample(Sample &&) noexcept = default;
    Sample &operator=(Sample &&) noexcept = default;
    ~Sample() = default;

    [[nodiscard]] const std::filesystem::path &getImagePath() const noexcept { return image_path_; }
    [[nodiscard]] const std::string &getGroundTruth() const noexcept { return ground_truth_; }
    [[nodiscard]] const std::optional<std::string> &getPrediction() const noexcept { return prediction_; }
    [[nodiscard]] bool hasPrediction() const noexcept { return prediction_.has_value(); }
    [[nodiscard]] bool isCorrect() const noexcept { return prediction_.has_value() && *prediction_ == ground_truth_; }

    // A prediction is written exactly once per run.
    void setPrediction(std::string label) {
        if (prediction_.has_value()) {
            throw std::logic_error(fmt::format("Prediction already set for sample: {}", image_path_.string()));
        }
        prediction_ = std::move(label);
    }

    void clearPrediction() noexcept { prediction_.reset(); }

    [[nodiscard]] std::string toString() const {
        return fmt::format("Sample(path={}, ground_truth={}, prediction={})", image_path_.string(), ground_truth_,
                           prediction_.value_or("<none>"));
    }

private:
    std::filesystem::path image_path_;
    std::string ground_truth_;
    std::optional<std::string> prediction_;
};

using ClassLabel = std::string;
using Samples = std::vector<Sample>;

#endif // TYPE_SAMPLE_HPP
