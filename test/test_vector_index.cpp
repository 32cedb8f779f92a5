#include "facewatch/database/vector_index.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace facewatch;
using namespace facewatch::testing;

TEST(VectorIndex, EmptyIndexReturnsNothing) {
    VectorIndex index(8, Metric::InnerProduct);
    EXPECT_TRUE(index.search(random_unit(8, 1), 5).empty());
    EXPECT_EQ(index.size(), 0u);
}

TEST(VectorIndex, NodeIdsFollowInsertionOrder) {
    VectorIndex index(4, Metric::L2);
    EXPECT_EQ(index.insert(axis(4, 0)), 0);
    EXPECT_EQ(index.insert(axis(4, 1)), 1);
    EXPECT_EQ(index.insert(axis(4, 2)), 2);
    EXPECT_EQ(index.size(), 3u);
}

TEST(VectorIndex, FindsStoredVectorFirst) {
    const size_t dim = 32;
    VectorIndex index(dim, Metric::InnerProduct);
    std::vector<EmbeddingVector> data;
    for (unsigned i = 0; i < 300; ++i) {
        data.push_back(random_unit(dim, i + 1));
        index.insert(data.back());
    }

    int found = 0;
    for (int i = 0; i < 300; i += 7) {
        auto hits = index.search(data[i], 3);
        ASSERT_FALSE(hits.empty());
        if (hits.front().node == i) found++;
        for (size_t j = 1; j < hits.size(); ++j) {
            EXPECT_LE(hits[j - 1].distance, hits[j].distance);
        }
    }
    // 43 queries; the graph should recover (nearly) all of them
    EXPECT_GE(found, 41);
}

TEST(VectorIndex, ReturnsAtMostK) {
    VectorIndex index(8, Metric::L2);
    for (unsigned i = 0; i < 5; ++i) index.insert(random_unit(8, i + 1));

    EXPECT_EQ(index.search(random_unit(8, 99), 3).size(), 3u);
    EXPECT_EQ(index.search(random_unit(8, 99), 10).size(), 5u);
}

TEST(VectorIndex, SameSeedSameGraph) {
    VectorIndex a(16, Metric::InnerProduct);
    VectorIndex b(16, Metric::InnerProduct);
    for (unsigned i = 0; i < 100; ++i) {
        auto v = random_unit(16, i + 1);
        a.insert(v);
        b.insert(v);
    }
    EXPECT_EQ(a.top_layer(), b.top_layer());

    auto q = random_unit(16, 500);
    auto ra = a.search(q, 5);
    auto rb = b.search(q, 5);
    ASSERT_EQ(ra.size(), rb.size());
    for (size_t i = 0; i < ra.size(); ++i) {
        EXPECT_EQ(ra[i].node, rb[i].node);
    }
}

TEST(VectorIndex, RejectsWrongDimension) {
    VectorIndex index(8, Metric::InnerProduct);
    EXPECT_THROW(index.insert(EmbeddingVector(4, 1.0f)), std::invalid_argument);
    index.insert(random_unit(8, 1));
    EXPECT_THROW(index.search(EmbeddingVector(4, 1.0f), 1), std::invalid_argument);
}

TEST(VectorIndex, MetricNames) {
    EXPECT_EQ(metric_from_string("ip"), Metric::InnerProduct);
    EXPECT_EQ(metric_from_string("cosine"), Metric::InnerProduct);
    EXPECT_EQ(metric_from_string("l2"), Metric::L2);
    EXPECT_THROW(metric_from_string("manhattan"), std::invalid_argument);
}
