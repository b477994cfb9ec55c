#pragma once

#include <mutex>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "embedder.hpp"
#include "index_config.hpp"
#include "index_handle.hpp"
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    struct BuildStats {
        size_t total_candidates = 0;
        size_t successful_embeddings = 0;
        size_t failed_embeddings = 0;
        double embedding_time = 0.0;
        double indexing_time = 0.0;
        double total_time = 0.0;
        double embeddings_per_second = 0.0;
        IndexStatistics index_statistics;
    };

    void to_json(nlohmann::json& j, const BuildStats& stats);

    /**
     * @brief Builds an index from content refs and publishes it through the handle.
     *
     * The new index is filled privately; on any failure the handle keeps
     * whatever it held before.
     */
    class Indexer {
    public:
        Indexer(IndexHandle& handle, Embedder& embedder, IndexConfig config, size_t batch_size, bool normalize);

        /**
         * @brief Embeds and indexes the contents.
         * Without force_rebuild an already built index is kept and its statistics returned.
         * @return NoContent for an empty input, NoEmbeddings when every item failed to embed.
         */
        Result<BuildStats> build(const std::vector<ContentRef>& contents, bool force_rebuild);

        std::optional<BuildStats> last_stats() const;

    private:
        Record make_record(const ContentRef& content, size_t embedding_index) const;

        IndexHandle& m_handle;
        Embedder& m_embedder;
        IndexConfig m_config;
        size_t m_batch_size;
        bool m_normalize;

        mutable std::mutex m_mutex;
        std::optional<BuildStats> m_last_stats;
        std::shared_ptr<VectorIndex> m_built;
    };

}
