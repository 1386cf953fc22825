#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "reco/Mmr.hpp"
#include "test_helpers.hpp"

using namespace reco;
using namespace testutil;

class MmrTest : public ::testing::Test {
protected:
    void SetUp() override {
        // rows 0 and 1 are near-duplicates, row 2 is orthogonal to both
        data_ = EmbeddingData::build(make_matrix({
                                         {1.0f, 0.0f},
                                         {0.99f, 0.141f},
                                         {0.0f, 1.0f},
                                         {0.7f, 0.7f},
                                     }),
                                     make_index({1, 2, 3, 4}));
    }

    std::unique_ptr<EmbeddingData> data_;
};

TEST_F(MmrTest, FirstPickIsMostRelevant) {
    const ScoreVector rel = {0.2, 0.9, 0.5, 0.1};
    const auto picked = mmr_rerank(*data_, {0, 1, 2, 3}, rel, 1, 0.3);
    ASSERT_EQ(picked.size(), 1u);
    EXPECT_EQ(picked[0], 1u);
}

TEST_F(MmrTest, LambdaOneIsRelevanceOrder) {
    const ScoreVector rel = {1.0, 0.9, 0.5, 0.7};
    const auto picked = mmr_rerank(*data_, {0, 1, 2, 3}, rel, 4, 1.0);
    EXPECT_EQ(picked, (std::vector<std::size_t>{0, 1, 3, 2}));
}

TEST_F(MmrTest, DiversityPushesNearDuplicateDown) {
    const ScoreVector rel = {1.0, 0.9, 0.5, 0.0};
    const auto picked = mmr_rerank(*data_, {0, 1, 2}, rel, 3, 0.5);
    EXPECT_EQ(picked, (std::vector<std::size_t>{0, 2, 1}));
}

TEST_F(MmrTest, TiesGoToEarlierCandidate) {
    const ScoreVector rel = {0.5, 0.5, 0.5, 0.5};
    const auto picked = mmr_rerank(*data_, {3, 2, 1, 0}, rel, 1, 0.7);
    ASSERT_EQ(picked.size(), 1u);
    EXPECT_EQ(picked[0], 3u);
}

TEST_F(MmrTest, SizeIsMinOfKAndCandidatesWithoutRepeats) {
    const ScoreVector rel = {0.4, 0.3, 0.2, 0.1};
    for (std::size_t k : {0u, 1u, 2u, 4u, 10u}) {
        const auto picked = mmr_rerank(*data_, {0, 2, 3}, rel, k, 0.6);
        EXPECT_EQ(picked.size(), std::min<std::size_t>(k, 3));
        std::set<std::size_t> uniq(picked.begin(), picked.end());
        EXPECT_EQ(uniq.size(), picked.size());
        for (std::size_t r : picked) EXPECT_NE(r, 1u);
    }
}

TEST_F(MmrTest, EmptyCandidates) {
    EXPECT_TRUE(mmr_rerank(*data_, {}, {1.0, 1.0, 1.0, 1.0}, 5, 0.5).empty());
}
