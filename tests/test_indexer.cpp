#include <gtest/gtest.h>

#include <stdexcept>

#include "engine/indexer.hpp"
#include "test_helpers.hpp"

using namespace retina::engine;
using retina::test::FakeEmbedder;
using retina::test::TempDir;

namespace {

    // Fails a whole batch at once when it contains the given key.
    class BatchThrowingEmbedder : public FakeEmbedder {
    public:
        BatchThrowingEmbedder(size_t dim, std::string key) : FakeEmbedder(dim), m_key(std::move(key)) {}

        EncodedBatch encode_many(const std::vector<ContentRef>& contents) override {
            for (const auto& c : contents) {
                if (c.describe() == m_key) throw std::runtime_error("batch endpoint crashed");
            }
            return FakeEmbedder::encode_many(contents);
        }

    private:
        std::string m_key;
    };

}

class IndexerTest : public ::testing::Test {
protected:
    IndexerTest() : handle(tmp.path() / "indexes"), embedder(4) {
        config.dimension = 4;
        config.M = 4;
        config.ef_construction = 32;
        config.ef_search = 16;
        config.max_elements = 100;
    }

    std::vector<ContentRef> texts(size_t n) {
        std::vector<ContentRef> refs;
        for (size_t i = 0; i < n; ++i) refs.push_back(ContentRef::from_text("caption " + std::to_string(i)));
        return refs;
    }

    TempDir tmp;
    IndexHandle handle;
    FakeEmbedder embedder;
    IndexConfig config;
};

TEST_F(IndexerTest, NoContentLeavesStateUntouched) {
    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build({}, false);
    ASSERT_FALSE(stats.ok());
    EXPECT_EQ(stats.code(), ErrorCode::NoContent);
    EXPECT_FALSE(handle.has_index());
    EXPECT_FALSE(indexer.last_stats().has_value());

    ASSERT_TRUE(indexer.build(texts(3), false).ok());
    auto before = handle.current();
    auto again = indexer.build({}, true);
    EXPECT_EQ(again.code(), ErrorCode::NoContent);
    EXPECT_EQ(handle.current(), before);
    EXPECT_EQ(handle.current()->size(), 3u);
}

TEST_F(IndexerTest, AllEmbeddingsFailingIsNoEmbeddings) {
    auto refs = texts(2);
    embedder.fail_on("caption 0");
    embedder.fail_on("caption 1");

    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build(refs, false);
    ASSERT_FALSE(stats.ok());
    EXPECT_EQ(stats.code(), ErrorCode::NoEmbeddings);
    EXPECT_FALSE(handle.has_index());
}

TEST_F(IndexerTest, FailedItemsAreSkippedAndCounted) {
    auto refs = texts(10);
    embedder.fail_on("caption 3");
    embedder.fail_on("caption 7");

    Indexer indexer(handle, embedder, config, 4, true);
    auto stats = indexer.build(refs, false);
    ASSERT_TRUE(stats.ok()) << stats.error().describe();
    EXPECT_EQ(stats->total_candidates, 10u);
    EXPECT_EQ(stats->successful_embeddings, 8u);
    EXPECT_EQ(stats->failed_embeddings, 2u);
    EXPECT_EQ(stats->index_statistics.num_elements, 8u);

    // Ids follow embedding order, skipping the failures.
    auto index = handle.current();
    EXPECT_EQ(index->record(3)->get_string("text"), "caption 4");
    EXPECT_EQ(std::get<std::int64_t>(*index->record(3)->get("embedding_index")), 3);
}

TEST_F(IndexerTest, ThrowingItemIsCountedAsFailed) {
    embedder.throw_on("caption 2");

    Indexer indexer(handle, embedder, config, 4, true);
    auto stats = indexer.build(texts(6), false);
    ASSERT_TRUE(stats.ok()) << stats.error().describe();
    EXPECT_EQ(stats->successful_embeddings, 5u);
    EXPECT_EQ(stats->failed_embeddings, 1u);
    EXPECT_EQ(handle.current()->size(), 5u);
}

TEST_F(IndexerTest, ThrowingBatchIsCountedAsFailed) {
    BatchThrowingEmbedder flaky(4, "caption 1");

    Indexer indexer(handle, flaky, config, 2, true);
    auto stats = indexer.build(texts(6), false);
    ASSERT_TRUE(stats.ok()) << stats.error().describe();
    EXPECT_EQ(stats->successful_embeddings, 4u);
    EXPECT_EQ(stats->failed_embeddings, 2u);
    EXPECT_EQ(handle.current()->record(0)->get_string("text"), "caption 2");
}

TEST_F(IndexerTest, FileRecordsDescribeTheSource) {
    auto file = tmp.write_file("photos/cat.png", "0123456789");
    Indexer indexer(handle, embedder, config, 8, true);
    ASSERT_TRUE(indexer.build({ContentRef::from_file(file)}, false).ok());

    auto rec = handle.current()->record(0);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->get_string("source"), file.string());
    EXPECT_EQ(rec->get_string("filename"), "cat.png");
    EXPECT_EQ(rec->get_string("directory"), file.parent_path().string());
    EXPECT_EQ(std::get<std::int64_t>(*rec->get("file_size")), 10);
    EXPECT_EQ(std::get<std::int64_t>(*rec->get("embedding_index")), 0);
}

TEST_F(IndexerTest, BuildWithoutForceIsIdempotent) {
    Indexer indexer(handle, embedder, config, 8, true);
    auto first = indexer.build(texts(5), false);
    ASSERT_TRUE(first.ok());
    auto built = handle.current();
    size_t calls = embedder.calls.load();

    auto second = indexer.build(texts(5), false);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(handle.current(), built);
    EXPECT_EQ(embedder.calls.load(), calls);
    EXPECT_EQ(second->successful_embeddings, first->successful_embeddings);
    EXPECT_EQ(second->index_statistics.num_elements, 5u);
    ASSERT_TRUE(indexer.last_stats().has_value());
    EXPECT_EQ(indexer.last_stats()->total_candidates, 5u);
}

TEST_F(IndexerTest, ForceRebuildPublishesFreshIndex) {
    Indexer indexer(handle, embedder, config, 8, true);
    ASSERT_TRUE(indexer.build(texts(5), false).ok());
    auto old = handle.current();

    auto rebuilt = indexer.build(texts(3), true);
    ASSERT_TRUE(rebuilt.ok());
    EXPECT_NE(handle.current(), old);
    EXPECT_EQ(handle.current()->size(), 3u);
    EXPECT_EQ(old->size(), 5u);
}

TEST_F(IndexerTest, ExistingOpenedIndexIsReported) {
    IndexConfig cfg = config;
    ASSERT_TRUE(handle.create(cfg).ok());
    ASSERT_TRUE(handle.current()->insert({1, 0, 0, 0}, Record()).ok());

    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build(texts(4), false);
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats->index_statistics.num_elements, 1u);
    EXPECT_EQ(embedder.calls.load(), 0u);
}

TEST_F(IndexerTest, EmptyCreatedIndexIsFilled) {
    ASSERT_TRUE(handle.create(config).ok());
    ASSERT_TRUE(handle.current()->empty());

    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build(texts(2), false);
    ASSERT_TRUE(stats.ok()) << stats.error().describe();
    EXPECT_EQ(stats->successful_embeddings, 2u);
    EXPECT_EQ(handle.current()->size(), 2u);
    EXPECT_EQ(embedder.calls.load(), 2u);
}

TEST_F(IndexerTest, DimensionComesFromFirstEmbeddingWhenUnset) {
    FakeEmbedder wide(12);
    IndexConfig cfg = config;
    cfg.dimension = 0;

    Indexer indexer(handle, wide, cfg, 8, true);
    auto stats = indexer.build(texts(3), false);
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats->index_statistics.dimension, 12u);
    EXPECT_EQ(handle.current()->config().dimension, 12u);
}

TEST_F(IndexerTest, EmbeddingsOfWrongLengthAreSkipped) {
    auto refs = texts(3);
    embedder.set("caption 1", {1, 2});

    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build(refs, false);
    ASSERT_TRUE(stats.ok());
    EXPECT_EQ(stats->successful_embeddings, 2u);
    EXPECT_EQ(stats->failed_embeddings, 1u);
}

TEST_F(IndexerTest, StatisticsSerializeToJson) {
    Indexer indexer(handle, embedder, config, 8, true);
    auto stats = indexer.build(texts(2), false);
    ASSERT_TRUE(stats.ok());

    nlohmann::json j = stats.value();
    for (const char* key : {"total_candidates", "successful_embeddings", "failed_embeddings", "embedding_time",
                            "indexing_time", "total_time", "embeddings_per_second", "index_statistics"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["index_statistics"]["space"], "cosine");
}
