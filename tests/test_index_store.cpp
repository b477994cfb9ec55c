#include <gtest/gtest.h>

#include <fstream>
#include <random>

#include <nlohmann/json.hpp>

#include "engine/index_handle.hpp"
#include "engine/index_store.hpp"
#include "test_helpers.hpp"

using namespace retina::engine;
using retina::test::TempDir;
using retina::test::random_vector;

class IndexStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tmp.path() / "indexes";
    }

    std::unique_ptr<VectorIndex> make_index(size_t count, std::uint32_t seed = 1) {
        IndexConfig cfg;
        cfg.dimension = 8;
        cfg.M = 8;
        cfg.ef_construction = 64;
        cfg.ef_search = 32;
        cfg.max_elements = 1000;
        auto index = VectorIndex::create(cfg);
        EXPECT_TRUE(index.ok());
        std::mt19937 rng(seed);
        for (size_t i = 0; i < count; ++i) {
            Record r;
            r.set("source", "img_" + std::to_string(i) + ".png");
            r.set("embedding_index", static_cast<std::int64_t>(i));
            EXPECT_TRUE(index.value()->insert(random_vector(rng, 8), r).ok());
        }
        return std::move(index.value());
    }

    void rewrite_descriptor(const std::string& name, const std::string& key, const nlohmann::json& value) {
        auto path = root / name / kConfigFile;
        nlohmann::json j;
        {
            std::ifstream in(path);
            j = nlohmann::json::parse(in);
        }
        j[key] = value;
        std::ofstream out(path, std::ios::trunc);
        out << j.dump(2);
    }

    TempDir tmp;
    std::filesystem::path root;
};

TEST_F(IndexStoreTest, SaveThenLoadAnswersIdentically) {
    IndexStore store(root);
    auto index = make_index(120);
    ASSERT_TRUE(store.save(*index, "photos").ok());
    EXPECT_TRUE(std::filesystem::exists(root / "photos" / kGraphFile));
    EXPECT_TRUE(std::filesystem::exists(root / "photos" / kMetadataFile));
    EXPECT_TRUE(std::filesystem::exists(root / "photos" / kConfigFile));

    auto loaded = store.load("photos");
    ASSERT_TRUE(loaded.ok()) << loaded.error().describe();
    auto& restored = *loaded.value();
    EXPECT_EQ(restored.size(), index->size());
    EXPECT_EQ(restored.config(), index->config());

    std::mt19937 rng(77);
    for (int q = 0; q < 5; ++q) {
        auto query = random_vector(rng, 8);
        auto a = index->search(query, 5);
        auto b = restored.search(query, 5);
        ASSERT_TRUE(a.ok() && b.ok());
        ASSERT_EQ(a->size(), b->size());
        for (size_t i = 0; i < a->size(); ++i) {
            EXPECT_EQ(a.value()[i].id, b.value()[i].id);
            EXPECT_EQ(*index->record(a.value()[i].id), *restored.record(b.value()[i].id));
        }
    }
}

TEST_F(IndexStoreTest, IdsContinueAfterReload) {
    IndexStore store(root);
    auto index = make_index(10);
    ASSERT_TRUE(store.save(*index, "photos").ok());

    auto loaded = store.load("photos");
    ASSERT_TRUE(loaded.ok());
    std::mt19937 rng(3);
    auto id = loaded.value()->insert(random_vector(rng, 8), Record());
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(id.value(), 10u);
}

TEST_F(IndexStoreTest, UnknownNameIsNotFound) {
    IndexStore store(root);
    auto loaded = store.load("missing");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::NotFound);
}

TEST_F(IndexStoreTest, MissingArtifactIsNotFound) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(5), "photos").ok());
    std::filesystem::remove(root / "photos" / kMetadataFile);

    auto loaded = store.load("photos");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::NotFound);
}

TEST_F(IndexStoreTest, DescriptorDisagreeingWithGraphIsCorrupt) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(5), "photos").ok());
    rewrite_descriptor("photos", "dimension", 16);

    auto loaded = store.load("photos");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

TEST_F(IndexStoreTest, ElementCountMismatchIsCorrupt) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(5), "photos").ok());
    rewrite_descriptor("photos", "element_count", 6);

    auto loaded = store.load("photos");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

TEST_F(IndexStoreTest, MetadataFromAnotherUnitIsCorrupt) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(5), "small").ok());
    ASSERT_TRUE(store.save(*make_index(7), "large").ok());
    std::filesystem::copy_file(root / "large" / kMetadataFile, root / "small" / kMetadataFile,
                               std::filesystem::copy_options::overwrite_existing);

    auto loaded = store.load("small");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), ErrorCode::CorruptState);
}

TEST_F(IndexStoreTest, SavingAgainReplacesTheUnit) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(3), "photos").ok());
    ASSERT_TRUE(store.save(*make_index(9, 2), "photos").ok());

    auto loaded = store.load("photos");
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.value()->size(), 9u);
    EXPECT_EQ(store.list(), std::vector<std::string>{"photos"});
}

TEST_F(IndexStoreTest, ListIsSortedAndSkipsHiddenEntries) {
    IndexStore store(root);
    auto index = make_index(2);
    ASSERT_TRUE(store.save(*index, "zeta").ok());
    ASSERT_TRUE(store.save(*index, "alpha").ok());
    std::filesystem::create_directories(root / ".staging-beta");

    EXPECT_EQ(store.list(), (std::vector<std::string>{"alpha", "zeta"}));
    EXPECT_TRUE(store.exists("alpha"));
    EXPECT_FALSE(store.exists("beta"));
}

TEST_F(IndexStoreTest, RemoveDeletesAllArtifacts) {
    IndexStore store(root);
    ASSERT_TRUE(store.save(*make_index(2), "photos").ok());
    ASSERT_TRUE(store.remove("photos").ok());

    EXPECT_FALSE(std::filesystem::exists(root / "photos"));
    EXPECT_TRUE(store.list().empty());
    EXPECT_EQ(store.load("photos").code(), ErrorCode::NotFound);
    EXPECT_EQ(store.remove("photos").code(), ErrorCode::NotFound);
}

TEST_F(IndexStoreTest, InvalidNamesAreRejected) {
    IndexStore store(root);
    auto index = make_index(1);
    for (const std::string name : {"", ".hidden", "a/b", "..", "a\\b"}) {
        auto saved = store.save(*index, name);
        ASSERT_FALSE(saved.ok()) << name;
        EXPECT_EQ(saved.code(), ErrorCode::InvalidArgument) << name;
    }
}

TEST_F(IndexStoreTest, HandleSavesAndOpensTheCurrentIndex) {
    IndexHandle handle(root);
    EXPECT_FALSE(handle.has_index());
    EXPECT_EQ(handle.save("photos").code(), ErrorCode::NotReady);

    handle.publish(make_index(4));
    ASSERT_TRUE(handle.save("photos").ok());
    handle.close();
    EXPECT_FALSE(handle.has_index());

    ASSERT_TRUE(handle.open("photos").ok());
    ASSERT_TRUE(handle.has_index());
    EXPECT_EQ(handle.current()->size(), 4u);
    EXPECT_EQ(handle.list(), std::vector<std::string>{"photos"});
}

TEST_F(IndexStoreTest, PublishingKeepsOldIndexAliveForHolders) {
    IndexHandle handle(root);
    handle.publish(make_index(3));
    auto in_flight = handle.current();

    handle.publish(make_index(6));
    EXPECT_EQ(in_flight->size(), 3u);
    EXPECT_EQ(handle.current()->size(), 6u);
}

TEST_F(IndexStoreTest, HandleCreatePublishesEmptyIndex) {
    IndexHandle handle(root);
    IndexConfig cfg;
    cfg.dimension = 3;
    ASSERT_TRUE(handle.create(cfg).ok());
    ASSERT_TRUE(handle.has_index());
    EXPECT_TRUE(handle.current()->empty());

    cfg.dimension = 0;
    EXPECT_EQ(handle.create(cfg).code(), ErrorCode::InvalidArgument);
}
