#include "distance.hpp"

#include <cmath>

namespace retina::engine {

    const char* metric_name(Metric metric) {
        switch (metric) {
            case Metric::Cosine: return "cosine";
            case Metric::Euclidean: return "euclidean";
            case Metric::InnerProduct: return "inner_product";
        }
        return "cosine";
    }

    std::optional<Metric> parse_metric(const std::string& name) {
        if (name == "cosine") return Metric::Cosine;
        // "l2" and "ip" are the short names older configs used
        if (name == "euclidean" || name == "l2") return Metric::Euclidean;
        if (name == "inner_product" || name == "ip") return Metric::InnerProduct;
        return std::nullopt;
    }

    float dot(const float* a, const float* b, std::size_t dim) {
        float acc = 0.0f;
        std::size_t i = 0;
        for (; i + 4 <= dim; i += 4) {
            acc += a[i] * b[i] + a[i + 1] * b[i + 1] + a[i + 2] * b[i + 2] + a[i + 3] * b[i + 3];
        }
        for (; i < dim; ++i) {
            acc += a[i] * b[i];
        }
        return acc;
    }

    float l2_squared(const float* a, const float* b, std::size_t dim) {
        float acc = 0.0f;
        for (std::size_t i = 0; i < dim; ++i) {
            const float d = a[i] - b[i];
            acc += d * d;
        }
        return acc;
    }

    float norm(const float* a, std::size_t dim) {
        return std::sqrt(dot(a, a, dim));
    }

    float distance(Metric metric, const float* a, float norm_a, const float* b, float norm_b, std::size_t dim) {
        switch (metric) {
            case Metric::Euclidean:
                return l2_squared(a, b, dim);
            case Metric::InnerProduct:
                return 1.0f - dot(a, b, dim);
            case Metric::Cosine:
            default: {
                const float denom = norm_a * norm_b;
                if (denom <= 0.0f) return 1.0f;
                return 1.0f - dot(a, b, dim) / denom;
            }
        }
    }

    float to_similarity(Metric metric, float distance) {
        switch (metric) {
            case Metric::Euclidean:
                return 1.0f / (1.0f + distance);
            case Metric::InnerProduct:
                // distance is 1 - <a,b>
                return 1.0f - distance;
            case Metric::Cosine:
            default:
                return 1.0f - distance;
        }
    }

    void normalize(std::vector<float>& vec) {
        const float n = norm(vec.data(), vec.size());
        if (n <= 0.0f) return;
        for (float& v : vec) v /= n;
    }

}
