#include "indexer.hpp"
#include "distance.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>

namespace retina::engine {

    namespace {

        using Clock = std::chrono::steady_clock;

        double seconds_since(Clock::time_point start) {
            return std::chrono::duration<double>(Clock::now() - start).count();
        }

    }

    void to_json(nlohmann::json& j, const BuildStats& stats) {
        j = nlohmann::json{
            {"total_candidates", stats.total_candidates},
            {"successful_embeddings", stats.successful_embeddings},
            {"failed_embeddings", stats.failed_embeddings},
            {"embedding_time", stats.embedding_time},
            {"indexing_time", stats.indexing_time},
            {"total_time", stats.total_time},
            {"embeddings_per_second", stats.embeddings_per_second},
            {"index_statistics", stats.index_statistics}
        };
    }

    Indexer::Indexer(IndexHandle& handle, Embedder& embedder, IndexConfig config, size_t batch_size, bool normalize)
        : m_handle(handle), m_embedder(embedder), m_config(config),
          m_batch_size(std::max<size_t>(batch_size, 1)), m_normalize(normalize) {}

    std::optional<BuildStats> Indexer::last_stats() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_stats;
    }

    Record Indexer::make_record(const ContentRef& content, size_t embedding_index) const {
        Record record;
        if (content.kind == ContentRef::Kind::File) {
            std::error_code ec;
            auto size = std::filesystem::file_size(content.path, ec);
            record.set("source", content.path.string());
            record.set("filename", content.path.filename().string());
            record.set("directory", content.path.parent_path().string());
            record.set("file_size", static_cast<std::int64_t>(ec ? 0 : size));
        } else {
            record.set("text", content.text);
        }
        record.set("embedding_index", static_cast<std::int64_t>(embedding_index));
        return record;
    }

    Result<BuildStats> Indexer::build(const std::vector<ContentRef>& contents, bool force_rebuild) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto existing = m_handle.current();
        // A freshly created, still empty index is a target to fill, not a finished build.
        if (existing && !existing->empty() && !force_rebuild) {
            // Only reuse our statistics if the handle still publishes what we built.
            if (m_last_stats && existing == m_built) return *m_last_stats;
            BuildStats stats;
            stats.total_candidates = existing->size();
            stats.successful_embeddings = existing->size();
            stats.index_statistics = existing->statistics();
            std::cout << "[Indexer] Index already built (" << existing->size() << " items), skipping\n";
            return stats;
        }

        if (contents.empty()) return make_error(ErrorCode::NoContent, "no content to index");

        BuildStats stats;
        stats.total_candidates = contents.size();
        const auto start = Clock::now();

        std::vector<Embedding> embeddings;
        std::vector<size_t> sources;
        for (size_t offset = 0; offset < contents.size(); offset += m_batch_size) {
            size_t end = std::min(offset + m_batch_size, contents.size());
            std::vector<ContentRef> batch(contents.begin() + offset, contents.begin() + end);

            EncodedBatch encoded;
            try {
                encoded = m_embedder.encode_many(batch);
            } catch (const std::exception& e) {
                std::cerr << "[Indexer] Batch " << offset << "-" << end << " failed to embed: " << e.what() << "\n";
                continue;
            }
            for (size_t i = 0; i < encoded.embeddings.size(); ++i) {
                embeddings.push_back(std::move(encoded.embeddings[i]));
                sources.push_back(offset + encoded.valid_indices[i]);
            }
            std::cout << "[Indexer] Embedded " << end << "/" << contents.size() << "\n";
        }
        stats.embedding_time = seconds_since(start);

        if (embeddings.empty()) {
            return make_error(ErrorCode::NoEmbeddings, "all " + std::to_string(contents.size()) + " items failed to embed");
        }

        IndexConfig config = m_config;
        if (config.dimension == 0) config.dimension = embeddings.front().size();
        auto created = VectorIndex::create(config);
        if (!created) return created.error();
        std::shared_ptr<VectorIndex> index = std::move(created.value());

        const auto index_start = Clock::now();
        for (size_t i = 0; i < embeddings.size(); ++i) {
            if (m_normalize) normalize(embeddings[i]);
            auto id = index->insert(embeddings[i], make_record(contents[sources[i]], stats.successful_embeddings));
            if (!id) {
                if (id.code() != ErrorCode::DimensionMismatch) return id.error();
                std::cerr << "[Indexer] Skipping " << contents[sources[i]].describe() << ": " << id.error().describe() << "\n";
                continue;
            }
            ++stats.successful_embeddings;
        }
        stats.indexing_time = seconds_since(index_start);
        stats.failed_embeddings = stats.total_candidates - stats.successful_embeddings;

        if (stats.successful_embeddings == 0) {
            return make_error(ErrorCode::NoEmbeddings, "no embedding matched the index dimension");
        }

        stats.total_time = seconds_since(start);
        stats.embeddings_per_second =
            stats.embedding_time > 0.0 ? static_cast<double>(stats.successful_embeddings) / stats.embedding_time : 0.0;
        stats.index_statistics = index->statistics();

        m_handle.publish(index);
        m_built = index;
        m_last_stats = stats;

        std::cout << "[Indexer] Indexed " << stats.successful_embeddings << " items, "
                  << stats.failed_embeddings << " failed (" << stats.total_time << "s)\n";
        return stats;
    }

}
