#include "facewatch/review/unknown_review_queue.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace facewatch;
using namespace facewatch::testing;

class UnknownReviewQueueTest : public ::testing::Test {
protected:
    std::string submit(const EmbeddingVector& embedding, const ImageBytes& image = {}) {
        Detection d;
        d.embedding = embedding;
        d.confidence = 0.3f;
        d.tracking_key = 1;
        return queue.submit(d, image);
    }

    ReviewState state_of(const std::string& id) {
        Detection d;
        EXPECT_TRUE(store.get_detection(id, d));
        return d.review_state;
    }

    FlakyFaceStore store;
    SimilarityIndex index;
    IdentityCatalog catalog{store, index};
    UnknownReviewQueue queue{store, catalog};
};

TEST_F(UnknownReviewQueueTest, SubmitCreatesUnreviewedEntry) {
    std::string id = submit(axis(8, 0), {0xFF, 0xD8});

    Detection d;
    ASSERT_TRUE(queue.get(id, d));
    EXPECT_EQ(d.review_state, ReviewState::Unreviewed);
    EXPECT_TRUE(d.review_flag);
    EXPECT_FALSE(d.image_id.empty());
    EXPECT_EQ(store.fetch_image(d.image_id), (ImageBytes{0xFF, 0xD8}));

    ASSERT_EQ(queue.pending().size(), 1u);
}

TEST_F(UnknownReviewQueueTest, DismissIsTerminal) {
    std::string id = submit(axis(8, 0));

    EXPECT_TRUE(queue.dismiss(id));
    EXPECT_EQ(state_of(id), ReviewState::Dismissed);
    EXPECT_TRUE(queue.pending().empty());

    EXPECT_FALSE(queue.dismiss(id));
    EXPECT_FALSE(queue.enroll(id, "eve"));
    EXPECT_FALSE(catalog.contains("eve"));
    EXPECT_EQ(state_of(id), ReviewState::Dismissed);

    EXPECT_FALSE(queue.dismiss("missing"));
}

TEST_F(UnknownReviewQueueTest, EnrollCreatesIdentityWithImageCopy) {
    std::string id = submit(axis(8, 3), {1, 2, 3, 4});

    ASSERT_TRUE(queue.enroll(id, "dave"));

    Detection d;
    ASSERT_TRUE(queue.get(id, d));
    EXPECT_EQ(d.review_state, ReviewState::Enrolled);
    EXPECT_EQ(d.enrolled_as, "dave");

    Identity dave;
    ASSERT_TRUE(catalog.get("dave", dave));
    EXPECT_EQ(dave.embedding, axis(8, 3));
    ASSERT_FALSE(dave.image_id.empty());
    EXPECT_NE(dave.image_id, d.image_id);
    EXPECT_EQ(store.fetch_image(dave.image_id), (ImageBytes{1, 2, 3, 4}));

    EXPECT_EQ(index.query(axis(8, 3), 1).front().name, "dave");

    // Terminal
    EXPECT_FALSE(queue.enroll(id, "dave2"));
    EXPECT_FALSE(queue.dismiss(id));

    // Deleting the detection keeps the identity's image
    EXPECT_TRUE(queue.delete_detection(id));
    EXPECT_FALSE(store.fetch_image(dave.image_id).empty());
}

TEST_F(UnknownReviewQueueTest, EnrollUnderExistingNameThrows) {
    catalog.enroll("alice", axis(8, 0));
    std::string id = submit(axis(8, 1), {9, 9});

    EXPECT_THROW(queue.enroll(id, "alice"), NameConflict);
    EXPECT_EQ(state_of(id), ReviewState::Unreviewed);
    EXPECT_EQ(store.stats().images, 1u);
}

TEST_F(UnknownReviewQueueTest, EnrollMissingDetection) {
    EXPECT_FALSE(queue.enroll("missing", "zed"));
    EXPECT_FALSE(catalog.contains("zed"));
}

TEST_F(UnknownReviewQueueTest, DeleteFromAnyState) {
    std::string unreviewed = submit(axis(8, 0), {1});
    std::string dismissed = submit(axis(8, 1), {2});
    ASSERT_TRUE(queue.dismiss(dismissed));

    EXPECT_TRUE(queue.delete_detection(unreviewed));
    EXPECT_TRUE(queue.delete_detection(dismissed));
    EXPECT_FALSE(queue.delete_detection(unreviewed));

    Detection d;
    EXPECT_FALSE(queue.get(unreviewed, d));
    EXPECT_EQ(store.stats().images, 0u);
}

TEST_F(UnknownReviewQueueTest, FindSimilarScansUnreviewedOnly) {
    std::string target = submit(axis(8, 0));
    std::string close = submit(at_cosine(8, 0.95f, 1));
    std::string closer = submit(at_cosine(8, 0.99f, 2));
    std::string far = submit(axis(8, 3));
    std::string dismissed = submit(at_cosine(8, 0.97f, 4));
    ASSERT_TRUE(queue.dismiss(dismissed));

    auto results = queue.find_similar(target, 0.8f, 10);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].detection.id, closer);
    EXPECT_EQ(results[1].detection.id, close);
    EXPECT_GE(results[0].similarity, results[1].similarity);

    for (const auto& r : results) {
        EXPECT_NE(r.detection.id, target);
        EXPECT_NE(r.detection.id, far);
    }

    EXPECT_EQ(queue.find_similar(target, 0.8f, 1).size(), 1u);
    EXPECT_TRUE(queue.find_similar("missing", 0.5f, 10).empty());
}

TEST_F(UnknownReviewQueueTest, FindSimilarDefaultsFromConfig) {
    std::string target = submit(axis(8, 0));
    submit(at_cosine(8, 0.85f, 1));
    submit(at_cosine(8, 0.5f, 2));

    EXPECT_EQ(queue.find_similar(target).size(), 1u);
}
