#pragma once

#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include "embedder.hpp"
#include "index_handle.hpp"
#include "metrics.hpp"
#include "query_result.hpp"
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    enum class RetrieverState {
        Uninitialized,
        ReadyNoIndex,
        ReadyIndexBuilt,
        Querying
    };

    const char* to_string(RetrieverState state);

    struct RetrieverOptions {
        float similarity_threshold = 0.2f;
        bool normalize = true;
        size_t generation_concurrency_limit = 2;
    };

    /**
     * @brief Query pipeline: embed, search, threshold filter, generate.
     *
     * Queries run against whatever index the handle currently publishes.
     * Stage failures come back as QueryResult{success=false}; only a
     * pipeline that cannot accept queries returns an Error (NotReady).
     */
    class Retriever {
    public:
        /**
         * @param generator May be null; generation is then skipped.
         */
        Retriever(IndexHandle& handle, Embedder& embedder, Generator* generator, RetrieverOptions options);

        /**
         * @brief Validates the options and leaves the Uninitialized state.
         */
        Result<void> initialize();

        void attach_metrics(MetricsRecorder* metrics) { m_metrics = metrics; }

        RetrieverState state() const;

        Result<QueryResult> query(const std::string& text, size_t k, bool want_generation,
                                  const CancellationToken* cancel = nullptr);

        nlohmann::json status() const;

    private:
        std::vector<GenerationOutcome> generate_all(const std::string& text, const std::vector<RetrievedItem>& items,
                                                    const CancellationToken* cancel);

        IndexHandle& m_handle;
        Embedder& m_embedder;
        Generator* m_generator;
        MetricsRecorder* m_metrics = nullptr;
        RetrieverOptions m_options;
        std::atomic<bool> m_initialized{false};
        std::atomic<size_t> m_active_queries{0};
    };

}
