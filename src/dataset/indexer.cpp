// File: dataset/indexer.cpp

#include "dataset/indexer.hpp"

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace dataset {

    DatasetIndex DatasetIndexer::index(const std::filesystem::path &root) {
        if (!common::io::directoryExists(root)) {
            throw DatasetReadError(root, "not an existing directory");
        }

        DatasetIndex index;
        index.root = root;

        std::vector<std::filesystem::path> class_folders;
        try {
            class_folders = common::io::listDirectories(root);
        } catch (const std::runtime_error &e) {
            throw DatasetReadError(root, e.what());
        }

        if (class_folders.empty()) {
            throw DatasetReadError(root, "no class folders found");
        }

        for (const auto &class_folder: class_folders) {
            const ClassLabel label = class_folder.filename().string();
            index.classes.push_back(label);

            std::vector<std::filesystem::path> files;
            try {
                files = common::io::listFiles(class_folder);
            } catch (const std::runtime_error &e) {
                throw DatasetReadError(class_folder, e.what());
            }

            std::size_t image_count = 0;
            for (const auto &file: files) {
                if (!common::io::isImageFile(file)) {
                    LOG_DEBUG("Skipping non-image file: {}", file.string());
                    continue;
                }
                index.samples.emplace_back(file, label);
                ++image_count;
            }

            if (image_count == 0) {
                index.events.warn(stage_, "Class '{}' contains no images", label);
            } else {
                LOG_DEBUG("Class '{}': {} images", label, image_count);
            }
        }

        index.events.info(stage_, "Found {} images in {} classes under {}", index.samples.size(), index.classes.size(),
                          root.string());
        return index;
    }

    SamplesByClass DatasetIndexer::groupByClass(const DatasetIndex &index) {
        SamplesByClass grouped = groupByClass(index.samples);
        for (const auto &label: index.classes) {
            grouped.try_emplace(label);
        }
        return grouped;
    }

    SamplesByClass DatasetIndexer::groupByClass(const Samples &samples) {
        SamplesByClass grouped;
        for (const auto &sample: samples) {
            grouped[sample.getGroundTruth()].push_back(sample);
        }
        return grouped;
    }

} // namespace dataset
