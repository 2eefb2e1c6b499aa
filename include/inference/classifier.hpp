// File: inference/classifier.hpp

#ifndef INFERENCE_CLASSIFIER_HPP
#define INFERENCE_CLASSIFIER_HPP

#include <filesystem>
#include <string>

#include "types/errors.hpp"
#include "types/sample.hpp"

namespace inference {

    // Boundary to whatever runs the model. Only the top-1 label crosses it.
    class ClassifierPort {
    public:
        virtual ~ClassifierPort() = default;

        // Returns the top-1 label for the image. Throws InferenceError if the image cannot be classified.
        [[nodiscard]] virtual ClassLabel predict(const std::filesystem::path &image_path) = 0;

        // Whether predict() may be called from several threads at once.
        [[nodiscard]] virtual bool isThreadSafe() const noexcept { return false; }
    };

} // namespace inference

#endif // INFERENCE_CLASSIFIER_HPP
