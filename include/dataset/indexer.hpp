// File: dataset/indexer.hpp

#ifndef DATASET_INDEXER_HPP
#define DATASET_INDEXER_HPP

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/event_log.hpp"
#include "types/errors.hpp"
#include "types/sample.hpp"

namespace dataset {

    struct DatasetIndex {
        std::filesystem::path root;
        std::vector<ClassLabel> classes; // Every class folder found, sorted, including empty ones
        Samples samples;
        common::logging::EventLog events;
    };

    using SamplesByClass = std::map<ClassLabel, Samples>;

    class DatasetIndexer {
    public:
        static constexpr std::string_view stage_ = "indexing";

        /*
         * Walks root/{class}/{image}. Images are jpg, jpeg or png (any case); hidden entries are skipped.
         * Classes and files are visited in lexicographic order so the index is reproducible.
         * Throws DatasetReadError if the root is missing, unreadable or holds no class folders.
         */
        [[nodiscard]] static DatasetIndex index(const std::filesystem::path &root);

        // Groups samples by ground truth. Classes present in the index with no image map to an empty list.
        [[nodiscard]] static SamplesByClass groupByClass(const DatasetIndex &index);
        [[nodiscard]] static SamplesByClass groupByClass(const Samples &samples);
    };

} // namespace dataset

#endif // DATASET_INDEXER_HPP
