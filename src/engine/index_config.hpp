#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "distance.hpp"
#include "retina/result.hpp"

namespace retina::engine {

    /**
     * @brief Parameters fixed at index creation. Changing dimension or
     * metric requires building a new index.
     */
    struct IndexConfig {
        size_t dimension = 0;              // 0 = take it from the first embedding
        Metric metric = Metric::Cosine;
        size_t M = 16;                     // max links per node above layer 0 (2*M at layer 0)
        size_t ef_construction = 200;
        size_t ef_search = 50;
        size_t max_elements = 10000;
        std::uint32_t random_seed = 100;

        Result<void> validate() const {
            if (dimension == 0) return make_error(ErrorCode::InvalidArgument, "dimension must be > 0");
            if (M < 2) return make_error(ErrorCode::InvalidArgument, "M must be >= 2");
            if (ef_search < 1) return make_error(ErrorCode::InvalidArgument, "ef_search must be >= 1");
            if (ef_construction < M) return make_error(ErrorCode::InvalidArgument, "ef_construction must be >= M");
            if (max_elements < 1) return make_error(ErrorCode::InvalidArgument, "max_elements must be >= 1");
            return {};
        }

        bool operator==(const IndexConfig& other) const {
            return dimension == other.dimension && metric == other.metric && M == other.M &&
                   ef_construction == other.ef_construction && ef_search == other.ef_search &&
                   max_elements == other.max_elements && random_seed == other.random_seed;
        }
        bool operator!=(const IndexConfig& other) const { return !(*this == other); }
    };

    inline void to_json(nlohmann::json& j, const IndexConfig& cfg) {
        j = nlohmann::json{
            {"dimension", cfg.dimension},
            {"distance_metric", metric_name(cfg.metric)},
            {"M", cfg.M},
            {"ef_construction", cfg.ef_construction},
            {"ef_search", cfg.ef_search},
            {"max_elements", cfg.max_elements},
            {"random_seed", cfg.random_seed}
        };
    }

    // Missing keys keep their defaults; an unknown metric name throws std::invalid_argument.
    inline void from_json(const nlohmann::json& j, IndexConfig& cfg) {
        if (j.contains("dimension")) cfg.dimension = j["dimension"].get<size_t>();
        if (j.contains("distance_metric")) {
            auto name = j["distance_metric"].get<std::string>();
            auto metric = parse_metric(name);
            if (!metric) throw std::invalid_argument("unknown distance_metric: " + name);
            cfg.metric = *metric;
        }
        if (j.contains("M")) cfg.M = j["M"].get<size_t>();
        if (j.contains("ef_construction")) cfg.ef_construction = j["ef_construction"].get<size_t>();
        if (j.contains("ef_search")) cfg.ef_search = j["ef_search"].get<size_t>();
        if (j.contains("max_elements")) cfg.max_elements = j["max_elements"].get<size_t>();
        if (j.contains("random_seed")) cfg.random_seed = j["random_seed"].get<std::uint32_t>();
    }

}
