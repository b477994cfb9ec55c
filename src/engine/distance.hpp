#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retina::engine {

    enum class Metric : std::uint8_t {
        Cosine = 0,
        Euclidean = 1,
        InnerProduct = 2
    };

    const char* metric_name(Metric metric);
    std::optional<Metric> parse_metric(const std::string& name);

    float dot(const float* a, const float* b, std::size_t dim);
    float l2_squared(const float* a, const float* b, std::size_t dim);
    float norm(const float* a, std::size_t dim);

    /**
     * @brief Distance under the given metric; smaller is closer.
     * Cosine takes precomputed norms so the graph can cache them per node.
     */
    float distance(Metric metric, const float* a, float norm_a, const float* b, float norm_b, std::size_t dim);

    /**
     * @brief Converts a distance into a presentational similarity score.
     * Cosine: 1 - d. Euclidean: 1 / (1 + d). Inner product: the raw dot product.
     */
    float to_similarity(Metric metric, float distance);

    /**
     * @brief Scales the vector to unit length in place. Zero vectors are left untouched.
     */
    void normalize(std::vector<float>& vec);

}
