#include "facewatch/recognition/adaptive_updater.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace facewatch;
using namespace facewatch::testing;

namespace {

// Stalls one chosen identity write so a later write can overtake it
class StallingFaceStore : public FlakyFaceStore {
public:
    void save_identity(const Identity& identity) override {
        if (++calls == stall_on) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        FlakyFaceStore::save_identity(identity);
    }

    std::atomic<int> calls{0};
    int stall_on = -1;
};

} // namespace

class AdaptiveUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.enroll("alice", axis(8, 0));
    }

    EmbeddingVector stored_embedding(const std::string& name) {
        Identity identity;
        EXPECT_TRUE(catalog.get(name, identity));
        return identity.embedding;
    }

    FlakyFaceStore store;
    SimilarityIndex index;
    IdentityCatalog catalog{store, index};
    ThreadPool writer{1};
};

TEST_F(AdaptiveUpdaterTest, UpdatesOnlyOnEveryFthMatch) {
    AdaptiveUpdater::Config config;
    config.update_frequency = 3;
    config.alpha = 0.5f;
    AdaptiveUpdater updater(catalog, &writer, config);

    EmbeddingVector observed = axis(8, 1);
    EXPECT_FALSE(updater.on_match("alice", observed));
    EXPECT_FALSE(updater.on_match("alice", observed));
    EXPECT_EQ(stored_embedding("alice"), axis(8, 0));

    EXPECT_TRUE(updater.on_match("alice", observed));
    EXPECT_EQ(updater.recognition_count("alice"), 3);

    EmbeddingVector expected = normalize({0.5f, 0.5f, 0, 0, 0, 0, 0, 0});
    EmbeddingVector updated = stored_embedding("alice");
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(updated[i], expected[i], 1e-6);
    }

    // Index sees the new vector
    auto hits = index.query(expected, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_NEAR(hits.front().similarity, 1.0f, 1e-5);
}

TEST_F(AdaptiveUpdaterTest, WritesThroughToStore) {
    AdaptiveUpdater::Config config;
    config.update_frequency = 1;
    AdaptiveUpdater updater(catalog, &writer, config);

    ASSERT_TRUE(updater.on_match("alice", axis(8, 1)));
    writer.wait_all();

    auto persisted = store.load_all_identities();
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted.front().recognition_count, 1);
    EXPECT_NEAR(persisted.front().embedding[1], stored_embedding("alice")[1], 1e-6);
    EXPECT_GT(persisted.front().embedding[1], 0.0f);
}

TEST_F(AdaptiveUpdaterTest, StoreFailureKeepsInMemoryUpdate) {
    AdaptiveUpdater::Config config;
    config.update_frequency = 1;
    AdaptiveUpdater updater(catalog, &writer, config);

    store.fail_saves = true;
    EXPECT_TRUE(updater.on_match("alice", axis(8, 1)));
    writer.wait_all();

    EXPECT_EQ(updater.write_failures(), 1u);
    EXPECT_GT(stored_embedding("alice")[1], 0.0f);
    EXPECT_FLOAT_EQ(store.load_all_identities().front().embedding[1], 0.0f);
}

TEST(AdaptiveUpdater, OverlappingWritesLeaveNewestStateInStore) {
    StallingFaceStore store;
    SimilarityIndex index;
    IdentityCatalog catalog(store, index);
    catalog.enroll("alice", axis(8, 0));

    // First write-through stalls on one worker while the second runs on another
    store.stall_on = 2;
    ThreadPool writer(2);
    AdaptiveUpdater::Config config;
    config.update_frequency = 1;
    config.alpha = 0.5f;
    AdaptiveUpdater updater(catalog, &writer, config);

    ASSERT_TRUE(updater.on_match("alice", axis(8, 1)));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(updater.on_match("alice", axis(8, 2)));
    writer.wait_all();

    Identity current;
    ASSERT_TRUE(catalog.get("alice", current));
    auto persisted = store.load_all_identities();
    ASSERT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted.front().recognition_count, 2);
    ASSERT_EQ(persisted.front().embedding.size(), current.embedding.size());
    for (size_t i = 0; i < current.embedding.size(); ++i) {
        EXPECT_NEAR(persisted.front().embedding[i], current.embedding[i], 1e-6);
    }
    EXPECT_GT(persisted.front().embedding[2], 0.0f);
    EXPECT_EQ(updater.write_failures(), 0u);
}

TEST_F(AdaptiveUpdaterTest, DisabledOnlyCounts) {
    AdaptiveUpdater::Config config;
    config.enabled = false;
    config.update_frequency = 1;
    AdaptiveUpdater updater(catalog, nullptr, config);

    EXPECT_FALSE(updater.on_match("alice", axis(8, 1)));
    EXPECT_EQ(updater.recognition_count("alice"), 1);
    EXPECT_EQ(stored_embedding("alice"), axis(8, 0));
}

TEST_F(AdaptiveUpdaterTest, UnknownIdentityIgnored) {
    AdaptiveUpdater updater(catalog, nullptr);
    EXPECT_FALSE(updater.on_match("ghost", axis(8, 1)));
}

TEST(AdaptiveUpdater, BlendIsNormalizedEma) {
    EmbeddingVector out = AdaptiveUpdater::blend({1, 0}, {0, 1}, 0.1f);
    EXPECT_NEAR(l2_norm(out), 1.0f, 1e-6);
    EXPECT_GT(out[0], out[1]);
    EXPECT_NEAR(out[1] / out[0], 0.1f / 0.9f, 1e-5);

    EXPECT_THROW(AdaptiveUpdater::blend({1, 0}, {1, 0, 0}, 0.1f), std::invalid_argument);
}

TEST(AdaptiveUpdater, InvalidConfigRejected) {
    FlakyFaceStore store;
    SimilarityIndex index;
    IdentityCatalog catalog(store, index);

    AdaptiveUpdater::Config config;
    config.update_frequency = 0;
    EXPECT_THROW((void)AdaptiveUpdater(catalog, nullptr, config), std::invalid_argument);

    config = AdaptiveUpdater::Config();
    config.alpha = 1.0f;
    EXPECT_THROW((void)AdaptiveUpdater(catalog, nullptr, config), std::invalid_argument);
}
