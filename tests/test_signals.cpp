#include <gtest/gtest.h>

#include <memory>

#include "reco/History.hpp"
#include "reco/Signals.hpp"
#include "test_helpers.hpp"

using namespace reco;
using namespace testutil;

class SignalsTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = EmbeddingData::build(make_matrix({
                                         {1.0f, 0.0f},
                                         {0.0f, 1.0f},
                                         {0.6f, 0.8f},
                                     }),
                                     make_index({10, 11, 12}));

        catalog_.genre_map[10] = {"Action"};
        catalog_.genre_map[11] = {"Drama"};
        catalog_.genre_map[12] = {"Action", "Drama"};
    }

    UserHistory history(const std::vector<InteractionRecord>& records) const {
        return build_history(records, kNow);
    }

    std::unique_ptr<EmbeddingData> data_;
    FakeCatalog catalog_;
    SignalConfig cfg_;
};

TEST(HistoryTest, DaysSinceFloorsAndNeverGoesNegative) {
    EXPECT_EQ(days_since(kNow, kNow), 0);
    EXPECT_EQ(days_since(kNow - kDay * 14 + 1, kNow), 13);
    EXPECT_EQ(days_since(kNow - kDay * 14, kNow), 14);
    EXPECT_EQ(days_since(kNow + kDay, kNow), 0);
}

TEST(HistoryTest, GroupsInteractionsByAction) {
    const UserHistory h = build_history({watch(1, 10, kNow - 5 * kDay),
                                         watch(1, 10, kNow - kDay),
                                         watch(1, 11, kNow),
                                         rate(1, 10, 4.0, kNow - 2 * kDay),
                                         rate(1, 10, 9.0, kNow - kDay),
                                         skip(1, 12),
                                         skip(1, 12)},
                                        kNow);

    ASSERT_EQ(h.watched.size(), 2u);
    EXPECT_EQ(h.watched[0].movie_id, 10);
    EXPECT_EQ(h.watched[0].timestamp, kNow - kDay);
    EXPECT_DOUBLE_EQ(h.ratings.at(10), 9.0);
    ASSERT_EQ(h.skipped.size(), 1u);
    EXPECT_FALSE(h.is_cold());

    EXPECT_TRUE(build_history({rate(1, 10, 8.0)}, kNow).is_cold());
}

TEST_F(SignalsTest, InterestSingleWatchIsThatMoviesRow) {
    InterestSignal s(*data_, cfg_);
    const ScoreVector v = s.compute(history({watch(1, 10, kNow - 3 * kDay), rate(1, 10, 8.0)}));

    ASSERT_EQ(v.size(), 3u);
    EXPECT_NEAR(v[0], 1.0, 1e-6);
    EXPECT_NEAR(v[1], 0.0, 1e-6);
    EXPECT_NEAR(v[2], 0.6, 1e-6);
}

TEST_F(SignalsTest, InterestDecaysOlderWatches) {
    // unrated: 0.5 today, 0.25 at one half-life -> weights 2/3 and 1/3
    InterestSignal s(*data_, cfg_);
    const ScoreVector v = s.compute(history({watch(1, 10, kNow), watch(1, 11, kNow - 14 * kDay)}));

    EXPECT_NEAR(v[0], 2.0 / 3.0, 1e-6);
    EXPECT_NEAR(v[1], 1.0 / 3.0, 1e-6);
    EXPECT_NEAR(v[2], 0.6 * 2.0 / 3.0 + 0.8 / 3.0, 1e-6);
}

TEST_F(SignalsTest, InterestRatingScalesWeight) {
    InterestSignal s(*data_, cfg_);
    const ScoreVector v = s.compute(history({watch(1, 10), watch(1, 11), rate(1, 10, 9.0), rate(1, 11, 3.0)}));

    EXPECT_NEAR(v[0], 0.75, 1e-6);
    EXPECT_NEAR(v[1], 0.25, 1e-6);
}

TEST_F(SignalsTest, InterestZerosWhenNothingUsable) {
    InterestSignal s(*data_, cfg_);
    EXPECT_EQ(s.compute(history({})), ScoreVector(3, 0.0));
    EXPECT_EQ(s.compute(history({watch(1, 99)})), ScoreVector(3, 0.0));
    EXPECT_EQ(s.compute(history({watch(1, 10), rate(1, 10, 0.0)})), ScoreVector(3, 0.0));
}

TEST_F(SignalsTest, DiscoveryMostSimilarToDislikedScoresZero) {
    DiscoverySignal s(*data_, cfg_);
    const ScoreVector v = s.compute(history({skip(1, 10)}));

    ASSERT_EQ(v.size(), 3u);
    EXPECT_DOUBLE_EQ(v[0], 0.0);
    EXPECT_NEAR(v[1], 1.0, 1e-6);
    EXPECT_NEAR(v[2], 0.4, 1e-6);
    for (double x : v) {
        EXPECT_GE(x, 0.0);
        EXPECT_LE(x, 1.0);
    }
}

TEST_F(SignalsTest, DiscoveryCountsLowRatingsAsDisliked) {
    DiscoverySignal s(*data_, cfg_);
    const ScoreVector low = s.compute(history({watch(1, 11), rate(1, 11, 3.0)}));
    EXPECT_DOUBLE_EQ(low[1], 0.0);
    EXPECT_NEAR(low[0], 1.0, 1e-6);

    // threshold is strict
    EXPECT_EQ(s.compute(history({watch(1, 11), rate(1, 11, 5.0)})), ScoreVector(3, 0.0));
}

TEST_F(SignalsTest, DiscoveryZerosWithoutDislikes) {
    DiscoverySignal s(*data_, cfg_);
    EXPECT_EQ(s.compute(history({watch(1, 10)})), ScoreVector(3, 0.0));
    EXPECT_EQ(s.compute(history({skip(1, 99)})), ScoreVector(3, 0.0));
}

TEST_F(SignalsTest, DiscoveryFlatScoresStayFinite) {
    auto flat = EmbeddingData::build(make_matrix({{1.0f, 0.0f}, {1.0f, 0.0f}}), make_index({1, 2}));
    DiscoverySignal s(*flat, cfg_);
    const ScoreVector v = s.compute(build_history({skip(1, 1)}, kNow));
    EXPECT_DOUBLE_EQ(v[0], 0.0);
    EXPECT_DOUBLE_EQ(v[1], 0.0);
}

TEST_F(SignalsTest, DiscoveryFlatScoresAreZeroWithoutEpsilon) {
    auto flat = EmbeddingData::build(make_matrix({{1.0f, 0.0f}, {1.0f, 0.0f}}), make_index({1, 2}));
    SignalConfig cfg;
    cfg.normalize_epsilon = 0.0;
    DiscoverySignal s(*flat, cfg);
    EXPECT_EQ(s.compute(build_history({skip(1, 1)}, kNow)), ScoreVector(2, 0.0));
}

TEST_F(SignalsTest, CollaborativeIsMeanSimilarityToWatched) {
    CollaborativeSignal s(*data_);
    const ScoreVector v = s.compute(history({watch(1, 10), watch(1, 11)}));

    EXPECT_NEAR(v[0], 0.5, 1e-6);
    EXPECT_NEAR(v[1], 0.5, 1e-6);
    EXPECT_NEAR(v[2], 0.7, 1e-6);

    EXPECT_EQ(s.compute(history({watch(1, 99)})), ScoreVector(3, 0.0));
}

TEST_F(SignalsTest, CategoryScalesToUnitMax) {
    CategorySignal s(*data_, catalog_);

    const ScoreVector one = s.compute(history({watch(1, 10)}));
    EXPECT_DOUBLE_EQ(one[0], 1.0);
    EXPECT_DOUBLE_EQ(one[1], 0.0);
    EXPECT_DOUBLE_EQ(one[2], 1.0);

    const ScoreVector two = s.compute(history({watch(1, 10), watch(1, 11)}));
    EXPECT_DOUBLE_EQ(two[0], 0.5);
    EXPECT_DOUBLE_EQ(two[1], 0.5);
    EXPECT_DOUBLE_EQ(two[2], 1.0);
}

TEST_F(SignalsTest, CategoryZerosWithoutGenres) {
    CategorySignal s(*data_, catalog_);
    EXPECT_EQ(s.compute(history({watch(1, 99)})), ScoreVector(3, 0.0));
    EXPECT_EQ(s.compute(history({})), ScoreVector(3, 0.0));
}

TEST_F(SignalsTest, DefaultSetHasOneOfEachKind) {
    const auto signals = make_default_signals(*data_, catalog_, cfg_);
    ASSERT_EQ(signals.size(), 4u);
    EXPECT_EQ(signals[0]->kind(), SignalKind::Interest);
    EXPECT_EQ(signals[1]->kind(), SignalKind::Discovery);
    EXPECT_EQ(signals[2]->kind(), SignalKind::Collaborative);
    EXPECT_EQ(signals[3]->kind(), SignalKind::Category);
    EXPECT_STREQ(signal_name(SignalKind::Category), "category");
}
