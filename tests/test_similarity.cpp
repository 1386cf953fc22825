#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "reco/Errors.hpp"
#include "reco/Recommender.hpp"
#include "test_helpers.hpp"

using namespace reco;
using namespace testutil;

class SimilarityTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = make_store(
            {
                {1.0f, 0.0f, 0.0f},
                {0.8f, 0.6f, 0.0f},
                {0.6f, 0.0f, 0.8f},
                {0.0f, 1.0f, 0.0f},
                {0.0f, 0.0f, 1.0f},
            },
            {1, 2, 3, 4, 5});
        opts_.clock = [] { return kNow; };
        recommender_ = std::make_unique<Recommender>(*store_, interactions_, catalog_, opts_);
    }

    std::unique_ptr<EmbeddingStore> store_;
    FakeCatalog catalog_;
    FakeInteractions interactions_;
    RecommenderOptions opts_;
    std::unique_ptr<Recommender> recommender_;
};

TEST_F(SimilarityTest, NearestByDotExcludingSelf) {
    const auto hits = recommender_->similar_items(1, 2, {});
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].movie_id, 2);
    EXPECT_NEAR(hits[0].similarity, 0.8, 1e-6);
    EXPECT_EQ(hits[1].movie_id, 3);
    EXPECT_NEAR(hits[1].similarity, 0.6, 1e-6);
}

TEST_F(SimilarityTest, ExcludeSetAndStableTies) {
    const auto hits = recommender_->similar_items(1, 2, {2});
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].movie_id, 3);
    // 4 and 5 both score 0; row order decides
    EXPECT_EQ(hits[1].movie_id, 4);
}

TEST_F(SimilarityTest, LargeNReturnsEveryOtherMovie) {
    const auto hits = recommender_->similar_items(3, 100, {});
    EXPECT_EQ(hits.size(), 4u);
    for (const auto& h : hits) EXPECT_NE(h.movie_id, 3);
}

TEST_F(SimilarityTest, UnknownMovieIsNotEmbedded) {
    EXPECT_THROW(recommender_->similar_items(99, 3, {}), NotEmbedded);
}

TEST_F(SimilarityTest, ForUserSkipsWatched) {
    interactions_.records = {watch(7, 2), skip(7, 3)};
    const auto hits = recommender_->similar_items_for_user(1, 2, 7);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].movie_id, 3);
    EXPECT_EQ(hits[1].movie_id, 4);
}

TEST_F(SimilarityTest, SearchRanksByCosine) {
    const auto hits = recommender_->search_by_vector({1.0f, 1.0f, 0.0f}, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].movie_id, 2);
    EXPECT_NEAR(hits[0].similarity, 1.4 / std::sqrt(2.0), 1e-6);
    EXPECT_EQ(hits[1].movie_id, 1);
    EXPECT_EQ(hits[2].movie_id, 4);
    EXPECT_NEAR(hits[1].similarity, 1.0 / std::sqrt(2.0), 1e-6);
}

TEST_F(SimilarityTest, SearchIgnoresQueryMagnitude) {
    const auto a = recommender_->search_by_vector({0.0f, 0.0f, 2.0f}, 5);
    const auto b = recommender_->search_by_vector({0.0f, 0.0f, 0.5f}, 5);
    ASSERT_EQ(a.size(), 5u);
    ASSERT_EQ(b.size(), 5u);
    EXPECT_EQ(a[0].movie_id, 5);
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].movie_id, b[i].movie_id);
        EXPECT_NEAR(a[i].similarity, b[i].similarity, 1e-9);
    }
}

TEST_F(SimilarityTest, SearchZeroQueryScoresZero) {
    const auto hits = recommender_->search_by_vector({0.0f, 0.0f, 0.0f}, 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_DOUBLE_EQ(hits[0].similarity, 0.0);
}

TEST_F(SimilarityTest, SearchDimensionMismatchThrows) {
    EXPECT_THROW(recommender_->search_by_vector({1.0f, 0.0f}, 3), std::invalid_argument);
}
