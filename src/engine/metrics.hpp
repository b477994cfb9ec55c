#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "query_result.hpp"
#include "retina/result.hpp"

namespace retina::engine {

    /**
     * @brief Everything measured for one successful query.
     */
    struct QueryRecord {
        std::string timestamp;
        std::string query;
        double total_time = 0.0;
        size_t num_results = 0;
        size_t num_responses = 0;
        double avg_similarity = 0.0;
        double max_similarity = 0.0;
        double min_similarity = 0.0;
        size_t successful_responses = 0;
        size_t failed_responses = 0;
        double embed_time = 0.0;
        double search_time = 0.0;
        double generation_time = 0.0;

        // Only meaningful when num_results > 0.
        double similarity_std = 0.0;
        double similarity_range = 0.0;
        double top1_similarity = 0.0;
        double top3_avg_similarity = 0.0;

        // Only meaningful when num_responses > 0.
        double avg_response_length = 0.0;
        double response_length_std = 0.0;
        double success_rate = 0.0;
    };

    struct WordCount {
        std::string word;
        size_t count = 0;
    };

    struct SessionReport {
        // session_info
        std::string start_time;
        double duration = 0.0;
        size_t total_queries = 0;

        // performance_metrics
        double avg_total_time = 0.0;
        double max_total_time = 0.0;
        double min_total_time = 0.0;
        double std_total_time = 0.0;
        double avg_results_per_query = 0.0;
        size_t total_results_retrieved = 0;

        // quality_metrics
        double avg_similarity = 0.0;
        double max_similarity = 0.0;
        double overall_success_rate = 0.0;
        double avg_response_length = 0.0;

        // query_analysis
        std::vector<WordCount> most_common_words;
        double avg_query_length = 0.0;
        size_t max_query_length = 0;
        size_t min_query_length = 0;

        // benchmark
        std::string response_time_rating;
        std::string similarity_rating;
        std::string success_rate_rating;
        std::vector<std::string> recommendations;
    };

    void to_json(nlohmann::json& j, const QueryRecord& record);
    void to_json(nlohmann::json& j, const SessionReport& report);

    /**
     * @brief Append-only log of query measurements for the session.
     * Internally locked; record() never fails the caller.
     */
    class MetricsRecorder {
    public:
        MetricsRecorder();

        void record(const QueryResult& result);

        size_t size() const;
        std::vector<QueryRecord> records() const;

        /**
         * @brief Aggregate report, or nullopt when nothing was recorded.
         */
        std::optional<SessionReport> report() const;

        /**
         * @brief Writes {metrics_data, session_report, export_timestamp} as JSON.
         */
        Result<void> export_json(const std::filesystem::path& destination) const;

        /**
         * @brief Default export file name, rag_metrics_<YYYYmmdd_HHMMSS>.json.
         */
        static std::string default_file_name();

    private:
        SessionReport build_report() const;

        mutable std::mutex m_mutex;
        std::vector<QueryRecord> m_records;
        std::chrono::system_clock::time_point m_session_start;
    };

}
