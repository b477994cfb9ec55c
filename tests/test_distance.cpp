#include <gtest/gtest.h>

#include <vector>

#include "engine/distance.hpp"

using namespace retina::engine;

namespace {

    float dist(Metric metric, const std::vector<float>& a, const std::vector<float>& b) {
        return distance(metric, a.data(), norm(a.data(), a.size()), b.data(), norm(b.data(), b.size()), a.size());
    }

}

TEST(DistanceTest, CosineOfIdenticalDirectionIsZero) {
    EXPECT_NEAR(dist(Metric::Cosine, {1, 2, 3}, {2, 4, 6}), 0.0f, 1e-6);
}

TEST(DistanceTest, CosineOfOrthogonalIsOne) {
    EXPECT_NEAR(dist(Metric::Cosine, {1, 0}, {0, 1}), 1.0f, 1e-6);
}

TEST(DistanceTest, CosineWithZeroVectorIsOne) {
    EXPECT_FLOAT_EQ(dist(Metric::Cosine, {0, 0, 0}, {1, 2, 3}), 1.0f);
    EXPECT_FLOAT_EQ(dist(Metric::Cosine, {0, 0, 0}, {0, 0, 0}), 1.0f);
}

TEST(DistanceTest, EuclideanIsSquared) {
    EXPECT_FLOAT_EQ(dist(Metric::Euclidean, {0, 0}, {3, 4}), 25.0f);
}

TEST(DistanceTest, InnerProductIsOneMinusDot) {
    EXPECT_FLOAT_EQ(dist(Metric::InnerProduct, {1, 2}, {3, 4}), 1.0f - 11.0f);
}

TEST(DistanceTest, SimilarityConversion) {
    EXPECT_FLOAT_EQ(to_similarity(Metric::Cosine, 0.25f), 0.75f);
    EXPECT_FLOAT_EQ(to_similarity(Metric::Euclidean, 3.0f), 0.25f);
    // Raw inner product recovered from 1 - dot, never the distance itself.
    EXPECT_FLOAT_EQ(to_similarity(Metric::InnerProduct, 1.0f - 0.8f), 0.8f);
    EXPECT_NE(to_similarity(Metric::InnerProduct, 0.2f), 0.2f);

    // Closer vectors rank higher: dot 0.9 beats dot 0.1.
    const std::vector<float> q = {1, 0};
    float near = to_similarity(Metric::InnerProduct, dist(Metric::InnerProduct, q, {0.9f, 0.1f}));
    float far = to_similarity(Metric::InnerProduct, dist(Metric::InnerProduct, q, {0.1f, 0.9f}));
    EXPECT_NEAR(near, 0.9f, 1e-6);
    EXPECT_NEAR(far, 0.1f, 1e-6);
    EXPECT_GT(near, far);
}

TEST(DistanceTest, ParseMetricNames) {
    EXPECT_EQ(parse_metric("cosine"), Metric::Cosine);
    EXPECT_EQ(parse_metric("euclidean"), Metric::Euclidean);
    EXPECT_EQ(parse_metric("l2"), Metric::Euclidean);
    EXPECT_EQ(parse_metric("inner_product"), Metric::InnerProduct);
    EXPECT_FALSE(parse_metric("manhattan").has_value());
    EXPECT_STREQ(metric_name(Metric::InnerProduct), "inner_product");
}

TEST(DistanceTest, NormalizeScalesToUnitLength) {
    std::vector<float> v = {3, 4};
    normalize(v);
    EXPECT_FLOAT_EQ(v[0], 0.6f);
    EXPECT_FLOAT_EQ(v[1], 0.8f);

    std::vector<float> zero = {0, 0};
    normalize(zero);
    EXPECT_EQ(zero, (std::vector<float>{0, 0}));
}
