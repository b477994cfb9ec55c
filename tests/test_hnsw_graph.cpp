#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <set>
#include <sstream>

#include "engine/hnsw_graph.hpp"
#include "test_helpers.hpp"

using namespace retina::engine;
using retina::test::random_vector;

namespace {

    IndexConfig small_config(size_t dim, Metric metric = Metric::Cosine) {
        IndexConfig cfg;
        cfg.dimension = dim;
        cfg.metric = metric;
        cfg.M = 8;
        cfg.ef_construction = 100;
        cfg.ef_search = 20;
        cfg.max_elements = 5000;
        return cfg;
    }

    std::vector<std::uint64_t> brute_force(const std::vector<Embedding>& data, const Embedding& q, size_t k, Metric metric) {
        std::vector<std::pair<float, std::uint64_t>> all;
        float qn = norm(q.data(), q.size());
        for (size_t i = 0; i < data.size(); ++i) {
            all.push_back({distance(metric, q.data(), qn, data[i].data(), norm(data[i].data(), q.size()), q.size()), i});
        }
        std::sort(all.begin(), all.end());
        std::vector<std::uint64_t> ids;
        for (size_t i = 0; i < k && i < all.size(); ++i) ids.push_back(all[i].second);
        return ids;
    }

}

TEST(HnswGraphTest, FourDimensionalCosineQuery) {
    HnswGraph graph(small_config(4));
    std::vector<float> a = {1, 0, 0, 0}, b = {0, 1, 0, 0}, c = {0.9f, 0.1f, 0, 0};
    EXPECT_EQ(graph.add(a.data()), 0u);
    EXPECT_EQ(graph.add(b.data()), 1u);
    EXPECT_EQ(graph.add(c.data()), 2u);

    auto hits = graph.search(a.data(), 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, 0u);
    EXPECT_NEAR(hits[0].distance, 0.0f, 1e-6);
    EXPECT_EQ(hits[1].id, 2u);
    EXPECT_NEAR(hits[1].distance, 0.0061f, 1e-3);
}

TEST(HnswGraphTest, ZeroKReturnsNothing) {
    HnswGraph graph(small_config(4));
    std::vector<float> a = {1, 0, 0, 0};
    graph.add(a.data());
    EXPECT_TRUE(graph.search(a.data(), 0).empty());
}

TEST(HnswGraphTest, KLargerThanSizeReturnsEverything) {
    HnswGraph graph(small_config(3, Metric::Euclidean));
    std::mt19937 rng(7);
    for (int i = 0; i < 5; ++i) {
        auto v = random_vector(rng, 3);
        graph.add(v.data());
    }
    auto q = random_vector(rng, 3);
    auto hits = graph.search(q.data(), 50);
    EXPECT_EQ(hits.size(), 5u);
}

TEST(HnswGraphTest, TiesAreBrokenBySmallerId) {
    HnswGraph graph(small_config(2, Metric::Euclidean));
    std::vector<float> far = {10, 10}, same = {1, 1};
    graph.add(far.data());
    graph.add(same.data());
    graph.add(same.data());
    graph.add(same.data());

    auto hits = graph.search(same.data(), 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, 1u);
    EXPECT_EQ(hits[1].id, 2u);
    EXPECT_EQ(hits[2].id, 3u);
}

TEST(HnswGraphTest, ResultsAscendAndAreUnique) {
    HnswGraph graph(small_config(16, Metric::Euclidean));
    std::mt19937 rng(11);
    for (int i = 0; i < 300; ++i) {
        auto v = random_vector(rng, 16);
        graph.add(v.data());
    }
    auto q = random_vector(rng, 16);
    auto hits = graph.search(q.data(), 25);
    ASSERT_EQ(hits.size(), 25u);

    std::set<std::uint64_t> seen;
    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_LT(hits[i].id, graph.size());
        EXPECT_TRUE(seen.insert(hits[i].id).second);
        if (i > 0) EXPECT_LE(hits[i - 1].distance, hits[i].distance);
    }
}

TEST(HnswGraphTest, LinkListsRespectLimits) {
    IndexConfig cfg = small_config(8, Metric::Euclidean);
    HnswGraph graph(cfg);
    std::mt19937 rng(3);
    for (int i = 0; i < 600; ++i) {
        auto v = random_vector(rng, 8);
        graph.add(v.data());
    }

    for (std::uint64_t id = 0; id < graph.size(); ++id) {
        ASSERT_LE(graph.level(id), graph.max_level());
        for (int layer = 0; layer <= graph.level(id); ++layer) {
            const auto& links = graph.links(id, layer);
            EXPECT_LE(links.size(), layer == 0 ? cfg.M * 2 : cfg.M);
            for (auto n : links) {
                EXPECT_NE(n, id);
                EXPECT_GE(graph.level(n), layer);
            }
        }
    }
    EXPECT_EQ(graph.level(graph.entry_point()), graph.max_level());
}

TEST(HnswGraphTest, RecallAgainstBruteForce) {
    IndexConfig cfg;
    cfg.dimension = 32;
    cfg.metric = Metric::Euclidean;
    cfg.M = 16;
    cfg.ef_construction = 200;
    cfg.ef_search = 64;
    cfg.max_elements = 2000;
    HnswGraph graph(cfg);

    std::mt19937 rng(42);
    std::vector<Embedding> data;
    for (int i = 0; i < 1500; ++i) {
        data.push_back(random_vector(rng, 32));
        graph.add(data.back().data());
    }

    const size_t k = 10;
    size_t found = 0, total = 0;
    for (int q = 0; q < 50; ++q) {
        auto query = random_vector(rng, 32);
        auto truth = brute_force(data, query, k, cfg.metric);
        auto hits = graph.search(query.data(), k);
        std::set<std::uint64_t> got;
        for (const auto& h : hits) got.insert(h.id);
        for (auto id : truth) found += got.count(id);
        total += truth.size();
    }
    EXPECT_GE(static_cast<double>(found) / static_cast<double>(total), 0.9);
}

TEST(HnswGraphTest, SerializedGraphAnswersIdentically) {
    HnswGraph graph(small_config(8));
    std::mt19937 rng(5);
    for (int i = 0; i < 200; ++i) {
        auto v = random_vector(rng, 8);
        graph.add(v.data());
    }

    std::stringstream buffer;
    graph.serialize(buffer);
    auto loaded = HnswGraph::deserialize(buffer);
    ASSERT_TRUE(loaded.ok()) << loaded.error().describe();
    EXPECT_EQ(loaded->size(), graph.size());
    EXPECT_EQ(loaded->config(), graph.config());
    EXPECT_EQ(loaded->max_level(), graph.max_level());
    EXPECT_EQ(loaded->entry_point(), graph.entry_point());

    for (int q = 0; q < 10; ++q) {
        auto query = random_vector(rng, 8);
        auto a = graph.search(query.data(), 5);
        auto b = loaded->search(query.data(), 5);
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i].id, b[i].id);
            EXPECT_FLOAT_EQ(a[i].distance, b[i].distance);
        }
    }
}

TEST(HnswGraphTest, TruncatedStreamIsCorrupt) {
    HnswGraph graph(small_config(4));
    std::vector<float> a = {1, 2, 3, 4};
    graph.add(a.data());
    graph.add(a.data());

    std::stringstream buffer;
    graph.serialize(buffer);
    std::string bytes = buffer.str();
    std::stringstream truncated(bytes.substr(0, bytes.size() - 6));

    auto loaded = HnswGraph::deserialize(truncated);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

TEST(HnswGraphTest, ForeignBytesAreCorrupt) {
    std::stringstream garbage("this is not a graph file at all");
    auto loaded = HnswGraph::deserialize(garbage);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

namespace {

    template <typename T>
    void put(std::ostream& out, T value) {
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    // A well-formed header announcing `count` nodes, followed by only `tail` bytes.
    std::string header_claiming(std::uint64_t count, std::uint64_t dimension, size_t tail) {
        std::ostringstream out;
        put<std::uint32_t>(out, 0x474E5452);
        put<std::uint32_t>(out, 1);
        put<std::uint64_t>(out, dimension);
        put<std::uint8_t>(out, 0);
        put<std::uint64_t>(out, 8);      // M
        put<std::uint64_t>(out, 100);    // ef_construction
        put<std::uint64_t>(out, 20);     // ef_search
        put<std::uint64_t>(out, count);  // max_elements
        put<std::uint32_t>(out, 100);
        put<std::uint64_t>(out, count);
        put<std::uint32_t>(out, 0);      // entry point
        put<std::int32_t>(out, 0);       // max level
        out << std::string(tail, '\0');
        return out.str();
    }

}

TEST(HnswGraphTest, HugeElementCountIsCorruptNotAllocated) {
    for (std::uint64_t count : {std::uint64_t{1} << 40, std::uint64_t{1} << 62}) {
        std::stringstream blob(header_claiming(count, 4, 64));
        auto loaded = HnswGraph::deserialize(blob);
        ASSERT_FALSE(loaded.ok()) << count;
        EXPECT_EQ(loaded.code(), ErrorCode::CorruptState) << count;
    }
}

TEST(HnswGraphTest, HugeDimensionIsCorruptNotAllocated) {
    std::stringstream blob(header_claiming(1, std::uint64_t{1} << 61, 64));
    auto loaded = HnswGraph::deserialize(blob);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

TEST(HnswGraphTest, LinkCountBeyondNodeCountIsCorrupt) {
    // One node of dimension 1 whose layer-0 list claims 10 links.
    std::string blob = header_claiming(1, 1, 0);
    std::ostringstream node;
    put<std::int32_t>(node, 0);
    put<float>(node, 1.0f);
    put<std::uint32_t>(node, 10);
    node << std::string(40, '\0');
    std::stringstream in(blob + node.str());

    auto loaded = HnswGraph::deserialize(in);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}
