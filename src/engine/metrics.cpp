#include "metrics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <numeric>
#include <set>
#include <sstream>

namespace retina::engine {

    namespace {

        const std::set<std::string> kStopWords = {
            "a", "an", "the", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by",
            "is", "are", "was", "were", "be", "been", "have", "has", "had", "do", "does", "did",
            "will", "would", "could", "should", "what", "where", "when", "why", "how",
            "this", "that", "these", "those"
        };

        std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt) {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm{};
            localtime_r(&t, &tm);
            std::ostringstream ss;
            ss << std::put_time(&tm, fmt);
            return ss.str();
        }

        std::string iso_now() {
            return format_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
        }

        double mean(const std::vector<double>& values) {
            if (values.empty()) return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // ddof = 0 for per-query spreads, 1 for the session's total_time spread.
        double stddev(const std::vector<double>& values, size_t ddof) {
            if (values.size() <= ddof) return 0.0;
            double m = mean(values);
            double acc = 0.0;
            for (double v : values) acc += (v - m) * (v - m);
            return std::sqrt(acc / static_cast<double>(values.size() - ddof));
        }

        std::string rate_lower_better(double value, double excellent, double good, double acceptable) {
            if (value <= excellent) return "excellent";
            if (value <= good) return "good";
            if (value <= acceptable) return "acceptable";
            return "poor";
        }

        std::string rate_higher_better(double value, double excellent, double good, double acceptable) {
            if (value >= excellent) return "excellent";
            if (value >= good) return "good";
            if (value >= acceptable) return "acceptable";
            return "poor";
        }

        std::vector<WordCount> common_words(const std::vector<QueryRecord>& records) {
            std::map<std::string, size_t> counts;
            std::vector<std::string> first_seen;
            for (const auto& rec : records) {
                std::istringstream words(rec.query);
                std::string word;
                while (words >> word) {
                    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });
                    if (word.size() <= 2 || kStopWords.count(word)) continue;
                    if (counts[word]++ == 0) first_seen.push_back(word);
                }
            }

            std::vector<WordCount> result;
            for (const auto& word : first_seen) result.push_back({word, counts[word]});
            // Stable: equal counts keep first-seen order.
            std::stable_sort(result.begin(), result.end(),
                             [](const WordCount& a, const WordCount& b) { return a.count > b.count; });
            if (result.size() > 10) result.resize(10);
            return result;
        }

    }

    void to_json(nlohmann::json& j, const QueryRecord& r) {
        j = nlohmann::json{
            {"timestamp", r.timestamp},
            {"query", r.query},
            {"total_time", r.total_time},
            {"num_results", r.num_results},
            {"num_responses", r.num_responses},
            {"avg_similarity", r.avg_similarity},
            {"max_similarity", r.max_similarity},
            {"min_similarity", r.min_similarity},
            {"successful_responses", r.successful_responses},
            {"failed_responses", r.failed_responses},
            {"embed_time", r.embed_time},
            {"search_time", r.search_time},
            {"generation_time", r.generation_time}
        };
        if (r.num_results > 0) {
            j["similarity_std"] = r.similarity_std;
            j["similarity_range"] = r.similarity_range;
            j["top1_similarity"] = r.top1_similarity;
            j["top3_avg_similarity"] = r.top3_avg_similarity;
        }
        if (r.num_responses > 0) {
            j["avg_response_length"] = r.avg_response_length;
            j["response_length_std"] = r.response_length_std;
            j["success_rate"] = r.success_rate;
        }
    }

    void to_json(nlohmann::json& j, const SessionReport& r) {
        nlohmann::json words = nlohmann::json::array();
        for (const auto& wc : r.most_common_words) words.push_back({{"word", wc.word}, {"count", wc.count}});

        j = nlohmann::json{
            {"session_info", {
                {"start_time", r.start_time},
                {"duration", r.duration},
                {"total_queries", r.total_queries}
            }},
            {"performance_metrics", {
                {"avg_total_time", r.avg_total_time},
                {"max_total_time", r.max_total_time},
                {"min_total_time", r.min_total_time},
                {"std_total_time", r.std_total_time},
                {"avg_results_per_query", r.avg_results_per_query},
                {"total_results_retrieved", r.total_results_retrieved}
            }},
            {"quality_metrics", {
                {"avg_similarity", r.avg_similarity},
                {"max_similarity", r.max_similarity},
                {"overall_success_rate", r.overall_success_rate},
                {"avg_response_length", r.avg_response_length}
            }},
            {"query_analysis", {
                {"most_common_words", words},
                {"query_length_stats", {
                    {"avg_length", r.avg_query_length},
                    {"max_length", r.max_query_length},
                    {"min_length", r.min_query_length}
                }}
            }},
            {"benchmark", {
                {"ratings", {
                    {"response_time", r.response_time_rating},
                    {"similarity_score", r.similarity_rating},
                    {"success_rate", r.success_rate_rating}
                }},
                {"recommendations", r.recommendations}
            }}
        };
    }

    MetricsRecorder::MetricsRecorder() : m_session_start(std::chrono::system_clock::now()) {}

    void MetricsRecorder::record(const QueryResult& result) {
        try {
            QueryRecord rec;
            rec.timestamp = iso_now();
            rec.query = result.query;
            rec.total_time = result.timings.total;
            rec.embed_time = result.timings.embed;
            rec.search_time = result.timings.search;
            rec.generation_time = result.timings.generation;
            rec.num_results = result.results.size();
            rec.num_responses = result.responses.size();

            if (!result.results.empty()) {
                std::vector<double> sims;
                for (const auto& item : result.results) sims.push_back(item.similarity);
                rec.avg_similarity = mean(sims);
                rec.max_similarity = *std::max_element(sims.begin(), sims.end());
                rec.min_similarity = *std::min_element(sims.begin(), sims.end());
                rec.similarity_std = stddev(sims, 0);
                rec.similarity_range = rec.max_similarity - rec.min_similarity;
                rec.top1_similarity = sims.front();
                rec.top3_avg_similarity = mean(std::vector<double>(sims.begin(), sims.begin() + std::min<size_t>(3, sims.size())));
            }

            if (!result.responses.empty()) {
                std::vector<double> lengths;
                for (const auto& outcome : result.responses) {
                    lengths.push_back(static_cast<double>(outcome.text.size()));
                    if (outcome.success) {
                        ++rec.successful_responses;
                    } else {
                        ++rec.failed_responses;
                    }
                }
                rec.avg_response_length = mean(lengths);
                rec.response_length_std = stddev(lengths, 0);
                rec.success_rate = static_cast<double>(rec.successful_responses) / static_cast<double>(rec.num_responses);
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_records.push_back(std::move(rec));
        } catch (const std::exception& e) {
            std::cerr << "[Metrics] Failed to record query: " << e.what() << "\n";
        }
    }

    size_t MetricsRecorder::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records.size();
    }

    std::vector<QueryRecord> MetricsRecorder::records() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records;
    }

    std::optional<SessionReport> MetricsRecorder::report() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.empty()) return std::nullopt;
        return build_report();
    }

    SessionReport MetricsRecorder::build_report() const {
        SessionReport r;
        auto now = std::chrono::system_clock::now();
        r.start_time = format_time(m_session_start, "%Y-%m-%dT%H:%M:%S");
        r.duration = std::chrono::duration<double>(now - m_session_start).count();
        r.total_queries = m_records.size();

        std::vector<double> times, results, avg_sims, response_lengths, query_lengths;
        size_t successful = 0, responses = 0;
        for (const auto& rec : m_records) {
            times.push_back(rec.total_time);
            results.push_back(static_cast<double>(rec.num_results));
            avg_sims.push_back(rec.avg_similarity);
            query_lengths.push_back(static_cast<double>(rec.query.size()));
            if (rec.num_responses > 0) response_lengths.push_back(rec.avg_response_length);
            r.max_similarity = std::max(r.max_similarity, rec.max_similarity);
            r.total_results_retrieved += rec.num_results;
            successful += rec.successful_responses;
            responses += rec.num_responses;
        }

        r.avg_total_time = mean(times);
        r.max_total_time = *std::max_element(times.begin(), times.end());
        r.min_total_time = *std::min_element(times.begin(), times.end());
        r.std_total_time = stddev(times, 1);
        r.avg_results_per_query = mean(results);

        r.avg_similarity = mean(avg_sims);
        r.overall_success_rate = responses > 0 ? static_cast<double>(successful) / static_cast<double>(responses) : 0.0;
        r.avg_response_length = mean(response_lengths);

        r.most_common_words = common_words(m_records);
        r.avg_query_length = mean(query_lengths);
        r.max_query_length = static_cast<size_t>(*std::max_element(query_lengths.begin(), query_lengths.end()));
        r.min_query_length = static_cast<size_t>(*std::min_element(query_lengths.begin(), query_lengths.end()));

        r.response_time_rating = rate_lower_better(r.avg_total_time, 1.0, 3.0, 5.0);
        r.similarity_rating = rate_higher_better(r.avg_similarity, 0.9, 0.8, 0.7);
        r.success_rate_rating = rate_higher_better(r.overall_success_rate, 0.95, 0.90, 0.85);

        if (r.avg_total_time > 5.0) {
            r.recommendations.push_back("Reduce response time: use a smaller index, a lower ef_search or faster models");
        }
        if (r.avg_similarity < 0.7) {
            r.recommendations.push_back("Improve embedding quality or lower the similarity threshold");
        }
        if (r.overall_success_rate < 0.9) {
            r.recommendations.push_back("Check the generator configuration and its failure cases");
        }
        if (r.recommendations.empty()) {
            r.recommendations.push_back("System performing well; keep monitoring");
        }
        return r;
    }

    Result<void> MetricsRecorder::export_json(const std::filesystem::path& destination) const {
        std::string text;
        try {
            nlohmann::json data;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                data["metrics_data"] = m_records;
                if (m_records.empty()) {
                    data["session_report"] = {{"message", "no metrics recorded yet"}};
                } else {
                    data["session_report"] = build_report();
                }
            }
            data["export_timestamp"] = iso_now();
            // Query text comes from the terminal and need not be valid UTF-8.
            text = data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const std::exception& e) {
            return make_error(ErrorCode::IoError, std::string("cannot encode metrics: ") + e.what());
        }

        std::error_code ec;
        if (destination.has_parent_path()) {
            std::filesystem::create_directories(destination.parent_path(), ec);
            if (ec) return make_error(ErrorCode::IoError, "cannot create " + destination.parent_path().string() + ": " + ec.message());
        }

        std::ofstream f(destination);
        if (!f) return make_error(ErrorCode::IoError, "cannot open " + destination.string());
        f << text;
        f.close();
        if (!f) return make_error(ErrorCode::IoError, "failed writing " + destination.string());

        std::cout << "[Metrics] Saved " << destination << "\n";
        return {};
    }

    std::string MetricsRecorder::default_file_name() {
        return "rag_metrics_" + format_time(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + ".json";
    }

}
