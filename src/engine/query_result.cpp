#include "query_result.hpp"

namespace retina::engine {

    nlohmann::json value_to_json(const Value& value) {
        return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
    }

    void to_json(nlohmann::json& j, const Record& record) {
        j = nlohmann::json::object();
        for (const auto& [key, value] : record) j[key] = value_to_json(value);
    }

    void to_json(nlohmann::json& j, const RetrievedItem& item) {
        j = nlohmann::json{
            {"id", item.id},
            {"distance", item.distance},
            {"similarity", item.similarity},
            {"metadata", item.metadata}
        };
    }

    void to_json(nlohmann::json& j, const GenerationOutcome& outcome) {
        j = nlohmann::json{
            {"rank", outcome.rank},
            {"id", outcome.id},
            {"success", outcome.success}
        };
        if (outcome.success) {
            j["response"] = outcome.text;
        } else {
            j["error"] = outcome.error;
        }
    }

    void to_json(nlohmann::json& j, const StageTimings& timings) {
        j = nlohmann::json{
            {"embed", timings.embed},
            {"search", timings.search},
            {"generation", timings.generation},
            {"total", timings.total}
        };
    }

    void to_json(nlohmann::json& j, const QueryResult& result) {
        j = nlohmann::json{
            {"query", result.query},
            {"success", result.success},
            {"results", result.results},
            {"responses", result.responses},
            {"timings", result.timings}
        };
        if (result.error) j["error"] = result.error->describe();
    }

}
