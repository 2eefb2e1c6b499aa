// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/logger.hpp"

namespace common::io {

    /**
     * @brief Checks if a directory exists.
     *
     * @param dir_path Path to the directory.
     * @return true if the path exists and is a directory, false otherwise.
     */
    inline bool directoryExists(const std::filesystem::path &dir_path) {
        std::error_code error;
        if (std::filesystem::is_directory(dir_path, error)) {
            LOG_TRACE("Directory exists: {}", dir_path.string());
            return true;
        }

        LOG_TRACE("Directory does not exist: {}", dir_path.string());
        return false;
    }

    /**
     * @brief Hidden and system entries (".DS_Store", ".git", ...) start with a dot.
     */
    inline bool isHidden(const std::filesystem::path &path) {
        const auto name = path.filename().string();
        return !name.empty() && name.front() == '.';
    }

    /**
     * @brief Case-insensitive extension check.
     *
     * @param path Path of the file.
     * @param extensions Accepted extensions without the leading dot, in lower case (e.g. "png").
     */
    inline bool hasExtension(const std::filesystem::path &path, std::initializer_list<std::string_view> extensions) {
        auto extension = path.extension().string();
        if (extension.size() < 2) {
            return false;
        }
        extension.erase(0, 1);
        std::ranges::transform(extension, extension.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return std::ranges::find(extensions, std::string_view(extension)) != extensions.end();
    }

    inline bool isImageFile(const std::filesystem::path &path) { return hasExtension(path, {"jpg", "jpeg", "png"}); }

    /**
     * @brief Creates a directory and all necessary parent directories. Existing directories are left untouched.
     *
     * @param dir_path Path to the directory.
     * @throws std::runtime_error if the directory could not be created.
     */
    inline void createDirectory(const std::filesystem::path &dir_path) {
        if (directoryExists(dir_path)) {
            return;
        }
        LOG_DEBUG("Creating directory: {}", dir_path.string());
        try {
            std::filesystem::create_directories(dir_path);
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not create directory: {}", dir_path.string()));
        }
    }

    /**
     * @brief Removes a directory tree if it exists.
     *
     * @throws std::runtime_error if the tree exists but could not be removed.
     */
    inline void removeDirectory(const std::filesystem::path &dir_path) {
        std::error_code error;
        const auto removed = std::filesystem::remove_all(dir_path, error);
        if (error) {
            LOG_ERROR("Could not remove directory {}: {}", dir_path.string(), error.message());
            throw std::runtime_error(fmt::format("Could not remove directory: {}", dir_path.string()));
        }
        LOG_DEBUG("Removed {} entries under {}", removed, dir_path.string());
    }

    /**
     * @brief Lists the visible subdirectories of a directory, sorted by name.
     *
     * @throws std::runtime_error if the directory could not be read.
     */
    inline std::vector<std::filesystem::path> listDirectories(const std::filesystem::path &dir_path) {
        std::vector<std::filesystem::path> directories;
        try {
            for (const auto &entry: std::filesystem::directory_iterator(dir_path)) {
                if (entry.is_directory() && !isHidden(entry.path())) {
                    directories.push_back(entry.path());
                }
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Could not list directory {}: {}", dir_path.string(), e.what());
            throw std::runtime_error(fmt::format("Could not list directory: {}", dir_path.string()));
        }

        std::ranges::sort(directories);
        LOG_TRACE("Listed {} directories in: {}", directories.size(), dir_path.string());
        return directories;
    }

    /**
     * @brief Lists the visible regular files of a directory, sorted by name.
     *
     * @throws std::runtime_error if the directory could not be read.
     */
    inline std::vector<std::filesystem::path> listFiles(const std::filesystem::path &dir_path) {
        std::vector<std::filesystem::path> files;
        try {
            for (const auto &entry: std::filesystem::directory_iterator(dir_path)) {
                if (entry.is_regular_file() && !isHidden(entry.path())) {
                    files.push_back(entry.path());
                }
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Could not list directory {}: {}", dir_path.string(), e.what());
            throw std::runtime_error(fmt::format("Could not list directory: {}", dir_path.string()));
        }

        std::ranges::sort(files);
        LOG_TRACE("Listed {} files in: {}", files.size(), dir_path.string());
        return files;
    }

    /**
     * @brief Copies a file.
     *
     * @param source_path Path to the source file.
     * @param destination_path Path to the destination file.
     * @param overwrite Flag indicating whether to overwrite the destination file if it exists.
     * @throws std::runtime_error if the file could not be copied.
     */
    inline void copyFile(const std::filesystem::path &source_path, const std::filesystem::path &destination_path,
                         const bool overwrite = false) {
        const std::filesystem::copy_options options =
                overwrite ? std::filesystem::copy_options::overwrite_existing : std::filesystem::copy_options::none;

        try {
            std::filesystem::copy_file(source_path, destination_path, options);
            LOG_TRACE("File copied successfully from {} to {}", source_path.string(), destination_path.string());
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Could not copy file: {}", e.what());
            throw std::runtime_error(fmt::format("Could not copy file: {}", e.what()));
        }
    }

    /**
     * @brief Writes a string to a file, replacing its content.
     *
     * @throws std::runtime_error if the file could not be opened or written.
     */
    inline void writeStringToFile(const std::filesystem::path &file_path, const std::string &content) {
        std::ofstream file(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open file: {}", file_path.string());
            throw std::runtime_error(fmt::format("Failed to open file: {}", file_path.string()));
        }

        file << content;
        file.close();
        if (file.fail()) {
            LOG_ERROR("Failed to write file: {}", file_path.string());
            throw std::runtime_error(fmt::format("Failed to write file: {}", file_path.string()));
        }
    }

    /**
     * @brief Reads the entire content of a file.
     *
     * @throws std::runtime_error if the file could not be opened.
     */
    inline std::string readFile(const std::filesystem::path &file_path) {
        std::ifstream file(file_path, std::ios::in | std::ios::binary);
        if (!file) {
            LOG_ERROR("Failed to open file: {}", file_path.string());
            throw std::runtime_error(fmt::format("Failed to open file: {}", file_path.string()));
        }
        return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    }
} // namespace common::io

#endif // IO_HPP
