#include "facewatch/recognition/recognition_pipeline.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <mutex>

using namespace facewatch;
using namespace facewatch::testing;

namespace {

const size_t kDim = 16;

EmbeddingVector alice_vec() { return axis(kDim, 0); }
EmbeddingVector bob_vec() { return at_cosine(kDim, 0.1f, 1); }

} // namespace

class RecognitionPipelineTest : public ::testing::Test {
protected:
    void enroll_alice_and_bob(RecognitionPipeline& pipeline) {
        pipeline.catalog().enroll("Alice", alice_vec());
        pipeline.catalog().enroll("Bob", bob_vec());
        ASSERT_NEAR(cosine_similarity(alice_vec(), bob_vec()), 0.1f, 1e-5);
    }

    FlakyFaceStore store;
};

TEST_F(RecognitionPipelineTest, KnownFaceMatches) {
    RecognitionPipeline pipeline(store);
    enroll_alice_and_bob(pipeline);

    FaceResult r = pipeline.process_face(1, alice_vec());
    EXPECT_EQ(r.decision, MatchDecision::Matched);
    EXPECT_EQ(r.name, "Alice");
    EXPECT_NEAR(r.confidence, 1.0f, 1e-5);

    pipeline.flush();
    StoreStats s = store.stats();
    EXPECT_EQ(s.matched_detections, 1u);
    EXPECT_EQ(s.pending_review, 0u);
}

TEST_F(RecognitionPipelineTest, OrthogonalFaceBelowSaveThresholdIsDropped) {
    RecognitionPipeline pipeline(store);
    enroll_alice_and_bob(pipeline);

    FaceResult r = pipeline.process_face(2, axis(kDim, 5));
    EXPECT_EQ(r.decision, MatchDecision::Discard);
    EXPECT_TRUE(r.name.empty());
    EXPECT_LE(r.confidence, 0.4f);

    pipeline.flush();
    EXPECT_TRUE(pipeline.review_queue().pending().empty());
}

TEST_F(RecognitionPipelineTest, L2MetricUsesSameThresholds) {
    PipelineConfig config;
    config.index.metric = Metric::L2;
    config.matcher.unknown_min_confidence = 0.0f;
    RecognitionPipeline pipeline(store, config);
    enroll_alice_and_bob(pipeline);

    FaceResult known = pipeline.process_face(1, alice_vec());
    EXPECT_EQ(known.decision, MatchDecision::Matched);
    EXPECT_EQ(known.name, "Alice");

    FaceResult stranger = pipeline.process_face(2, axis(kDim, 5));
    EXPECT_EQ(stranger.decision, MatchDecision::Queue);
    EXPECT_TRUE(stranger.name.empty());
    EXPECT_LE(stranger.confidence, 0.4f);

    pipeline.flush();
    EXPECT_EQ(pipeline.review_queue().pending().size(), 1u);
}

TEST_F(RecognitionPipelineTest, AdaptiveUpdateBlendsCurrentFrame) {
    PipelineConfig config;
    config.adaptive.update_frequency = 2;
    config.adaptive.alpha = 0.5f;
    RecognitionPipeline pipeline(store, config);
    pipeline.catalog().enroll("Alice", alice_vec());

    EXPECT_FALSE(pipeline.process_face(1, at_cosine(kDim, 0.8f, 1)).adapted);
    EmbeddingVector frame = at_cosine(kDim, 0.8f, 2);
    FaceResult r = pipeline.process_face(1, frame);
    ASSERT_EQ(r.decision, MatchDecision::Matched);
    EXPECT_TRUE(r.adapted);

    EmbeddingVector expected = AdaptiveUpdater::blend(alice_vec(), frame, 0.5f);
    Identity alice;
    ASSERT_TRUE(pipeline.catalog().get("Alice", alice));
    for (size_t i = 0; i < kDim; ++i) {
        EXPECT_NEAR(alice.embedding[i], expected[i], 1e-5);
    }
    // The earlier frame is still in the track buffer but does not leak in
    EXPECT_NEAR(alice.embedding[1], 0.0f, 1e-6);
    pipeline.flush();
}

TEST_F(RecognitionPipelineTest, OrthogonalFaceAtOrAboveSaveThresholdIsQueued) {
    PipelineConfig config;
    config.matcher.unknown_min_confidence = 0.0f;
    RecognitionPipeline pipeline(store, config);
    enroll_alice_and_bob(pipeline);

    std::mutex mutex;
    std::vector<Detection> notified;
    pipeline.set_unknown_listener([&](const Detection& d) {
        std::lock_guard<std::mutex> lock(mutex);
        notified.push_back(d);
    });

    FaceResult r = pipeline.process_face(3, axis(kDim, 5), {0xFF, 0xD8, 0xFF});
    EXPECT_EQ(r.decision, MatchDecision::Queue);
    EXPECT_TRUE(r.name.empty());
    EXPECT_LE(r.confidence, 0.4f);
    EXPECT_FALSE(r.near_match);

    pipeline.flush();

    auto pending = pipeline.review_queue().pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].review_state, ReviewState::Unreviewed);
    EXPECT_EQ(pending[0].tracking_key, 3);
    EXPECT_FALSE(pending[0].image_id.empty());

    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0].id, pending[0].id);
}

TEST_F(RecognitionPipelineTest, NearMatchFlagged) {
    RecognitionPipeline pipeline(store);
    enroll_alice_and_bob(pipeline);

    FaceResult r = pipeline.process_face(4, at_cosine(kDim, 0.35f, 7));
    EXPECT_EQ(r.decision, MatchDecision::Queue);
    EXPECT_TRUE(r.near_match);

    pipeline.flush();
    auto pending = pipeline.review_queue().pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_TRUE(pending[0].near_match);
}

TEST_F(RecognitionPipelineTest, TemporalSmoothingAcrossFrames) {
    RecognitionPipeline pipeline(store);
    enroll_alice_and_bob(pipeline);

    // One noisy frame is outvoted by the two before it
    pipeline.process_face(9, alice_vec());
    pipeline.process_face(9, alice_vec());
    FaceResult r = pipeline.process_face(9, axis(kDim, 6));
    EXPECT_EQ(r.decision, MatchDecision::Matched);
    EXPECT_EQ(r.name, "Alice");
}

TEST_F(RecognitionPipelineTest, AdaptiveUpdateAfterFrequencyMatches) {
    PipelineConfig config;
    config.adaptive.update_frequency = 2;
    RecognitionPipeline pipeline(store, config);
    enroll_alice_and_bob(pipeline);

    EmbeddingVector observed = at_cosine(kDim, 0.9f, 8);
    EXPECT_FALSE(pipeline.process_face(20, observed).adapted);
    EXPECT_TRUE(pipeline.process_face(20, observed).adapted);

    pipeline.flush();

    Identity alice;
    ASSERT_TRUE(pipeline.catalog().get("Alice", alice));
    EXPECT_GT(alice.embedding[8], 0.0f);
    EXPECT_NEAR(l2_norm(alice.embedding), 1.0f, 1e-5);

    for (const auto& persisted : store.load_all_identities()) {
        if (persisted.name == "Alice") {
            EXPECT_EQ(persisted.embedding, alice.embedding);
            EXPECT_EQ(persisted.recognition_count, 2);
        }
    }
}

TEST_F(RecognitionPipelineTest, WriteThroughFailureDoesNotReachMatching) {
    PipelineConfig config;
    config.adaptive.update_frequency = 1;
    RecognitionPipeline pipeline(store, config);
    enroll_alice_and_bob(pipeline);

    store.fail_saves = true;
    FaceResult r = pipeline.process_face(30, alice_vec());
    EXPECT_EQ(r.decision, MatchDecision::Matched);

    pipeline.flush();
    EXPECT_EQ(pipeline.updater().write_failures(), 1u);
}

TEST_F(RecognitionPipelineTest, ReloadRestoresCatalogAfterRestart) {
    {
        RecognitionPipeline pipeline(store);
        enroll_alice_and_bob(pipeline);
    }

    RecognitionPipeline restarted(store);
    EXPECT_EQ(restarted.reload(), 2u);
    EXPECT_EQ(restarted.process_face(1, bob_vec()).name, "Bob");
}

TEST_F(RecognitionPipelineTest, EndCycleEvictsIdleTracks) {
    PipelineConfig config;
    config.aggregator.max_idle_cycles = 1;
    RecognitionPipeline pipeline(store, config);

    pipeline.process_face(1, alice_vec());
    EXPECT_EQ(pipeline.aggregator().tracked_keys(), 1u);
    pipeline.end_cycle();
    pipeline.end_cycle();
    EXPECT_EQ(pipeline.aggregator().tracked_keys(), 0u);

    pipeline.process_face(2, alice_vec());
    pipeline.forget_track(2);
    EXPECT_EQ(pipeline.aggregator().tracked_keys(), 0u);
}

TEST_F(RecognitionPipelineTest, EnrollFromReviewThenRecognized) {
    PipelineConfig config;
    config.matcher.unknown_min_confidence = 0.0f;
    RecognitionPipeline pipeline(store, config);
    enroll_alice_and_bob(pipeline);

    pipeline.process_face(40, axis(kDim, 12));
    pipeline.flush();

    auto pending = pipeline.review_queue().pending();
    ASSERT_EQ(pending.size(), 1u);
    ASSERT_TRUE(pipeline.review_queue().enroll(pending[0].id, "Carol"));

    FaceResult r = pipeline.process_face(41, axis(kDim, 12));
    EXPECT_EQ(r.name, "Carol");
}
