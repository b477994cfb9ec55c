#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "retina/result.hpp"
#include "retina/types.hpp"

namespace retina::engine {

    struct RetrievedItem {
        std::uint64_t id = 0;
        float distance = 0.0f;
        float similarity = 0.0f;
        Record metadata;
    };

    struct GenerationOutcome {
        size_t rank = 0;              // 1-based position among the filtered results
        std::uint64_t id = 0;
        bool success = false;
        std::string text;
        std::string error;
    };

    // Seconds spent per pipeline stage.
    struct StageTimings {
        double embed = 0.0;
        double search = 0.0;
        double generation = 0.0;
        double total = 0.0;
    };

    /**
     * @brief Outcome of one query. A stage failure sets success=false and
     * error, keeping the timings of the stages that ran.
     */
    struct QueryResult {
        std::string query;
        bool success = true;
        std::optional<Error> error;
        std::vector<RetrievedItem> results;
        std::vector<GenerationOutcome> responses;
        StageTimings timings;
    };

    nlohmann::json value_to_json(const Value& value);
    void to_json(nlohmann::json& j, const Record& record);
    void to_json(nlohmann::json& j, const RetrievedItem& item);
    void to_json(nlohmann::json& j, const GenerationOutcome& outcome);
    void to_json(nlohmann::json& j, const StageTimings& timings);
    void to_json(nlohmann::json& j, const QueryResult& result);

}
