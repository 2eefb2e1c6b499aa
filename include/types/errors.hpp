// File: types/errors.hpp

#ifndef TYPE_ERRORS_HPP
#define TYPE_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

// Dataset root missing, unreadable or without class folders. Aborts a run.
class DatasetReadError : public std::runtime_error {
public:
    DatasetReadError(std::filesystem::path path, const std::string &reason) :
        std::runtime_error(fmt::format("Could not read dataset '{}': {}", path.string(), reason)),
        path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// A single image could not be classified. The sample is left out of the metrics.
class InferenceError : public std::runtime_error {
public:
    InferenceError(std::filesystem::path image_path, std::string cause) :
        std::runtime_error(fmt::format("Inference failed for '{}': {}", image_path.string(), cause)),
        image_path_(std::move(image_path)), cause_(std::move(cause)) {}

    [[nodiscard]] const std::filesystem::path &imagePath() const noexcept { return image_path_; }
    [[nodiscard]] const std::string &cause() const noexcept { return cause_; }

private:
    std::filesystem::path image_path_;
    std::string cause_;
};

// A single file of a split could not be materialized.
class SplitIOError : public std::runtime_error {
public:
    SplitIOError(std::filesystem::path source, std::filesystem::path destination, const std::string &reason) :
        std::runtime_error(fmt::format("Could not copy '{}' to '{}': {}", source.string(), destination.string(), reason)),
        source_(std::move(source)), destination_(std::move(destination)) {}

    [[nodiscard]] const std::filesystem::path &source() const noexcept { return source_; }
    [[nodiscard]] const std::filesystem::path &destination() const noexcept { return destination_; }

private:
    std::filesystem::path source_;
    std::filesystem::path destination_;
};

class MetricsInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An artifact (CSV, HTML, JSON) could not be written. Other artifacts are still attempted.
class ReportWriteError : public std::runtime_error {
public:
    ReportWriteError(std::filesystem::path path, const std::string &reason) :
        std::runtime_error(fmt::format("Could not write '{}': {}", path.string(), reason)), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class TrainingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // TYPE_ERRORS_HPP
