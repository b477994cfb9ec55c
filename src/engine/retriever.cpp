#include "retriever.hpp"
#include "distance.hpp"
#include "job_queue.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>
#include <iostream>
#include <thread>

namespace retina::engine {

    namespace {

        using Clock = std::chrono::steady_clock;

        double seconds_since(Clock::time_point start) {
            return std::chrono::duration<double>(Clock::now() - start).count();
        }

        class ActiveQuery {
        public:
            explicit ActiveQuery(std::atomic<size_t>& counter) : m_counter(counter) { ++m_counter; }
            ~ActiveQuery() { --m_counter; }

        private:
            std::atomic<size_t>& m_counter;
        };

        // What the generator looks at for a retrieved item.
        ContentRef content_of(const Record& metadata) {
            if (metadata.contains("source")) return ContentRef::from_file(metadata.get_string("source"));
            return ContentRef::from_text(metadata.get_string("text"));
        }

        std::string similarity_context(float similarity) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "Retrieved with similarity: %.3f", similarity);
            return buf;
        }

    }

    const char* to_string(RetrieverState state) {
        switch (state) {
            case RetrieverState::Uninitialized:   return "uninitialized";
            case RetrieverState::ReadyNoIndex:    return "ready_no_index";
            case RetrieverState::ReadyIndexBuilt: return "ready_index_built";
            case RetrieverState::Querying:        return "querying";
        }
        return "unknown";
    }

    Retriever::Retriever(IndexHandle& handle, Embedder& embedder, Generator* generator, RetrieverOptions options)
        : m_handle(handle), m_embedder(embedder), m_generator(generator), m_options(options) {}

    Result<void> Retriever::initialize() {
        if (m_options.generation_concurrency_limit < 1) {
            return make_error(ErrorCode::InvalidArgument, "generation_concurrency_limit must be >= 1");
        }
        if (!std::isfinite(m_options.similarity_threshold)) {
            return make_error(ErrorCode::InvalidArgument, "similarity_threshold must be finite");
        }
        m_initialized = true;
        return {};
    }

    RetrieverState Retriever::state() const {
        if (!m_initialized) return RetrieverState::Uninitialized;
        if (!m_handle.has_index()) return RetrieverState::ReadyNoIndex;
        if (m_active_queries > 0) return RetrieverState::Querying;
        return RetrieverState::ReadyIndexBuilt;
    }

    Result<QueryResult> Retriever::query(const std::string& text, size_t k, bool want_generation,
                                         const CancellationToken* cancel) {
        if (!m_initialized) return make_error(ErrorCode::NotReady, "retriever is not initialized");
        auto index = m_handle.current();
        if (!index) return make_error(ErrorCode::NotReady, "no index built or opened");

        ActiveQuery active(m_active_queries);
        QueryResult result;
        result.query = text;
        const auto start = Clock::now();

        auto finish_failed = [&](Error error) {
            std::cerr << "[Retriever] Query failed: " << error.describe() << "\n";
            result.success = false;
            result.error = std::move(error);
            result.timings.total = seconds_since(start);
            return result;
        };

        auto stage = Clock::now();
        Result<Embedding> embedding = make_error(ErrorCode::EncodingFailed, "query was not encoded");
        try {
            embedding = m_embedder.encode_one(ContentRef::from_text(text));
        } catch (const std::exception& e) {
            result.timings.embed = seconds_since(stage);
            return finish_failed(make_error(ErrorCode::EncodingFailed, e.what()));
        }
        result.timings.embed = seconds_since(stage);
        if (!embedding) return finish_failed(make_error(ErrorCode::EncodingFailed, embedding.error().message));
        if (m_options.normalize) normalize(embedding.value());

        stage = Clock::now();
        Result<std::vector<Neighbor>> hits = make_error(ErrorCode::CorruptState, "search did not run");
        try {
            hits = index->search(embedding.value(), k);
        } catch (const std::exception& e) {
            result.timings.search = seconds_since(stage);
            return finish_failed(make_error(ErrorCode::CorruptState, std::string("search failed: ") + e.what()));
        }
        result.timings.search = seconds_since(stage);
        if (!hits) return finish_failed(hits.error());

        const Metric metric = index->config().metric;
        for (const auto& hit : hits.value()) {
            float similarity = to_similarity(metric, hit.distance);
            if (similarity < m_options.similarity_threshold) continue;

            RetrievedItem item;
            item.id = hit.id;
            item.distance = hit.distance;
            item.similarity = similarity;
            item.metadata = index->record(hit.id).value_or(Record());
            result.results.push_back(std::move(item));
        }

        if (want_generation && !result.results.empty()) {
            if (m_generator) {
                stage = Clock::now();
                result.responses = generate_all(text, result.results, cancel);
                result.timings.generation = seconds_since(stage);
            } else {
                std::cerr << "[Retriever] Generation requested but no generator is configured\n";
            }
        }

        result.timings.total = seconds_since(start);
        std::cout << "[Retriever] '" << text << "': " << result.results.size() << " of " << hits->size()
                  << " results above threshold (" << result.timings.total << "s)\n";

        if (m_metrics) m_metrics->record(result);
        return std::move(result);
    }

    std::vector<GenerationOutcome> Retriever::generate_all(const std::string& text, const std::vector<RetrievedItem>& items,
                                                           const CancellationToken* cancel) {
        std::vector<GenerationOutcome> outcomes(items.size());
        JobQueue<size_t> jobs;
        for (size_t i = 0; i < items.size(); ++i) {
            outcomes[i].rank = i + 1;
            outcomes[i].id = items[i].id;
            jobs.push(i);
        }
        jobs.stop();

        auto worker = [&]() {
            size_t i = 0;
            while (jobs.pop(i)) {
                GenerationOutcome& outcome = outcomes[i];
                if (cancel && cancel->cancelled()) {
                    outcome.error = "cancelled";
                    continue;
                }
                try {
                    auto response = m_generator->generate(content_of(items[i].metadata), text,
                                                          similarity_context(items[i].similarity));
                    if (response) {
                        outcome.success = true;
                        outcome.text = std::move(response.value());
                    } else {
                        outcome.error = response.error().describe();
                    }
                } catch (const std::exception& e) {
                    outcome.error = make_error(ErrorCode::GenerationFailed, e.what()).describe();
                }
                if (!outcome.success) {
                    std::cerr << "[Retriever] Generation failed for id " << outcome.id << ": " << outcome.error << "\n";
                }
            }
        };

        const size_t workers = std::min(m_options.generation_concurrency_limit, items.size());
        std::vector<std::thread> threads;
        for (size_t w = 1; w < workers; ++w) threads.emplace_back(worker);
        worker();
        for (auto& t : threads) t.join();

        return outcomes;
    }

    nlohmann::json Retriever::status() const {
        nlohmann::json j;
        j["state"] = to_string(state());
        j["similarity_threshold"] = m_options.similarity_threshold;
        j["generation_concurrency_limit"] = m_options.generation_concurrency_limit;
        auto index = m_handle.current();
        if (index) {
            j["index"] = index->statistics();
        } else {
            j["index"] = nullptr;
        }
        return j;
    }

}
