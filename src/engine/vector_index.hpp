#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hnsw_graph.hpp"
#include "index_config.hpp"
#include "metadata_store.hpp"
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    // Artifacts of one persisted unit.
    inline constexpr const char* kGraphFile = "graph.bin";
    inline constexpr const char* kMetadataFile = "metadata.db";
    inline constexpr const char* kConfigFile = "config.json";
    inline constexpr int kFormatVersion = 1;

    struct IndexStatistics {
        size_t num_elements = 0;
        size_t dimension = 0;
        std::string space;
        size_t M = 0;
        size_t ef_construction = 0;
        size_t ef_search = 0;
        size_t max_elements = 0;
        int max_level = -1;
    };

    void to_json(nlohmann::json& j, const IndexStatistics& stats);

    /**
     * @brief The vector index: HNSW graph plus the Metadata Store that
     * shares its id space.
     *
     * Single writer, multiple readers: insert and write_unit take the
     * exclusive lock, search and lookups take the shared lock.
     */
    class VectorIndex {
    public:
        /**
         * @brief Creates an empty index. Fails with InvalidArgument on a bad config.
         */
        static Result<std::unique_ptr<VectorIndex>> create(const IndexConfig& config);

        /**
         * @brief Loads the three artifacts from a unit directory.
         * NotFound if one is missing, CorruptState if they disagree.
         */
        static Result<std::unique_ptr<VectorIndex>> read_unit(const std::filesystem::path& dir);

        VectorIndex(const VectorIndex&) = delete;
        VectorIndex& operator=(const VectorIndex&) = delete;

        /**
         * @brief Adds an embedding and its record.
         * @return The new id; DimensionMismatch or CapacityExceeded leave the index untouched.
         */
        Result<std::uint64_t> insert(const Embedding& embedding, Record record);

        /**
         * @brief Approximate top-k search, ascending by distance (ties by id).
         */
        Result<std::vector<Neighbor>> search(const Embedding& query, size_t k) const;

        /**
         * @brief Returns a copy of the record stored for an id.
         */
        std::optional<Record> record(std::uint64_t id) const;

        size_t size() const;
        bool empty() const { return size() == 0; }
        const IndexConfig& config() const { return m_config; }
        IndexStatistics statistics() const;

        /**
         * @brief Writes graph.bin, metadata.db and config.json into an existing directory.
         */
        Result<void> write_unit(const std::filesystem::path& dir) const;

    private:
        VectorIndex(HnswGraph graph, MetadataStore metadata);

        const IndexConfig m_config;
        mutable std::shared_mutex m_mutex;
        HnswGraph m_graph;
        MetadataStore m_metadata;
    };

}
