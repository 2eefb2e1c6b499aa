// File: common/io/image.hpp

#ifndef COMMON_IMAGE_IO_HPP
#define COMMON_IMAGE_IO_HPP

#include <filesystem>
#include <opencv2/imgcodecs.hpp>

#include "common/logging/logger.hpp"

namespace common::io::image {
    /**
     * @brief Reads an image from a file using OpenCV.
     *
     * @param file_path Path to the image file.
     * @param mode Flag specifying the color type of the loaded image.
     * @return cv::Mat The loaded image.
     * @throws std::runtime_error if the image could not be read or decoded.
     */
    inline cv::Mat readImage(const std::filesystem::path &file_path, const cv::ImreadModes mode = cv::IMREAD_COLOR) {
        LOG_TRACE("Reading image from file: {}", file_path.string());
        cv::Mat image = cv::imread(file_path.string(), mode);
        if (image.empty()) {
            LOG_ERROR("Could not read image: {}", file_path.string());
            throw std::runtime_error(fmt::format("Could not read image: {}", file_path.string()));
        }
        LOG_TRACE("Image read successfully: {} ({}x{})", file_path.string(), image.cols, image.rows);
        return image;
    }
} // namespace common::io::image

#endif // COMMON_IMAGE_IO_HPP
