#include <gtest/gtest.h>
#include "src/core/pairing/PairSelector.hpp"
#include <opencv2/core.hpp>
#include <set>

using namespace photo_pairing;
using photo_pairing::pairing::PairSelector;
using photo_pairing::pairing::solveAssignment;

namespace {

MatchCandidate candidate(const std::string& after, double score, int matches = 10) {
    MatchCandidate c;
    c.after_path = after;
    c.score = score;
    c.match_count = matches;
    return c;
}

RankedCandidates ranked(const std::string& before, std::vector<MatchCandidate> candidates) {
    RankedCandidates r;
    r.before_path = before;
    for (auto& c : candidates) {
        c.before_path = before;
    }
    r.candidates = std::move(candidates);
    return r;
}

SelectionParams selection(SelectionMode mode, double min_score = 0.0, bool shared = false) {
    SelectionParams params;
    params.mode = mode;
    params.min_score = min_score;
    params.allow_shared_targets = shared;
    return params;
}

double totalScore(const Assignment& assignment) {
    double total = 0.0;
    for (const auto& pair : assignment.pairs) {
        total += pair.score;
    }
    return total;
}

} // namespace

class PairSelectorTest : public ::testing::Test {
protected:
    // B1-A1 0.9, B1-A2 0.8, B2-A1 0.7, B2-A2 0.1
    const std::vector<std::string> befores{"B1", "B2"};
    const std::vector<std::string> afters{"A1", "A2"};
    const std::vector<RankedCandidates> crossing{
        ranked("B1", {candidate("A1", 0.9), candidate("A2", 0.8)}),
        ranked("B2", {candidate("A1", 0.7), candidate("A2", 0.1)}),
    };
};

TEST_F(PairSelectorTest, GreedyTakesHighestScoreFirst) {
    const PairSelector selector(selection(SelectionMode::GREEDY));
    const auto assignment = selector.select(befores, afters, crossing);

    ASSERT_EQ(assignment.pairs.size(), 2u);
    EXPECT_EQ(assignment.targetOf("B1"), std::optional<std::string>("A1"));
    EXPECT_EQ(assignment.targetOf("B2"), std::optional<std::string>("A2"));
    EXPECT_NEAR(totalScore(assignment), 1.0, 1e-9);
    EXPECT_TRUE(assignment.unmatched_before.empty());
    EXPECT_TRUE(assignment.unmatched_after.empty());
}

TEST_F(PairSelectorTest, OptimalMaximisesTotalScore) {
    const PairSelector selector(selection(SelectionMode::OPTIMAL));
    const auto assignment = selector.select(befores, afters, crossing);

    ASSERT_EQ(assignment.pairs.size(), 2u);
    EXPECT_EQ(assignment.targetOf("B1"), std::optional<std::string>("A2"));
    EXPECT_EQ(assignment.targetOf("B2"), std::optional<std::string>("A1"));
    EXPECT_NEAR(totalScore(assignment), 1.5, 1e-9);
}

TEST_F(PairSelectorTest, MinScoreFiltersWeakPairs) {
    const PairSelector selector(selection(SelectionMode::GREEDY, 0.5));
    const auto assignment = selector.select(befores, afters, crossing);

    ASSERT_EQ(assignment.pairs.size(), 1u);
    EXPECT_EQ(assignment.pairs[0].before_path, "B1");
    EXPECT_EQ(assignment.pairs[0].after_path, "A1");
    EXPECT_EQ(assignment.unmatched_before, std::vector<std::string>({"B2"}));
    EXPECT_EQ(assignment.unmatched_after, std::vector<std::string>({"A2"}));

    const PairSelector optimal(selection(SelectionMode::OPTIMAL, 0.5));
    const auto best = optimal.select(befores, afters, crossing);
    ASSERT_EQ(best.pairs.size(), 2u);
    EXPECT_EQ(best.targetOf("B1"), std::optional<std::string>("A2"));
}

TEST_F(PairSelectorTest, ZeroScoreNeverPairs) {
    const std::vector<RankedCandidates> zeros{
        ranked("B1", {candidate("A1", 0.0, 0)}),
        ranked("B2", {candidate("A2", 0.0, 0)}),
    };
    for (const auto mode : {SelectionMode::GREEDY, SelectionMode::OPTIMAL}) {
        const PairSelector selector(selection(mode));
        const auto assignment = selector.select(befores, afters, zeros);
        EXPECT_TRUE(assignment.pairs.empty());
        EXPECT_EQ(assignment.unmatched_before, befores);
        EXPECT_EQ(assignment.unmatched_after, afters);
    }
}

TEST_F(PairSelectorTest, SharedTargetsLetBeforePhotosReuseAfterPhotos) {
    for (const auto mode : {SelectionMode::GREEDY, SelectionMode::OPTIMAL}) {
        const PairSelector selector(selection(mode, 0.0, true));
        const auto assignment = selector.select(befores, afters, crossing);

        ASSERT_EQ(assignment.pairs.size(), 2u) << toString(mode);
        EXPECT_EQ(assignment.targetOf("B1"), std::optional<std::string>("A1"));
        EXPECT_EQ(assignment.targetOf("B2"), std::optional<std::string>("A1"));
        EXPECT_EQ(assignment.unmatched_after, std::vector<std::string>({"A2"}));
    }
}

TEST_F(PairSelectorTest, IgnoresPhotosOutsideTheGroup) {
    const std::vector<RankedCandidates> stray{
        ranked("B1", {candidate("A9", 0.95), candidate("A2", 0.4)}),
        ranked("B9", {candidate("A1", 0.99)}),
    };
    const PairSelector selector(selection(SelectionMode::GREEDY));
    const auto assignment = selector.select(befores, afters, stray);

    ASSERT_EQ(assignment.pairs.size(), 1u);
    EXPECT_EQ(assignment.pairs[0].before_path, "B1");
    EXPECT_EQ(assignment.pairs[0].after_path, "A2");
    EXPECT_EQ(assignment.unmatched_before, std::vector<std::string>({"B2"}));
    EXPECT_EQ(assignment.unmatched_after, std::vector<std::string>({"A1"}));
}

TEST_F(PairSelectorTest, DuplicateCandidatesKeepHighestScore) {
    const std::vector<RankedCandidates> duplicated{
        ranked("B1", {candidate("A1", 0.2, 4), candidate("A1", 0.6, 12)}),
    };
    const PairSelector selector(selection(SelectionMode::GREEDY));
    const auto assignment = selector.select({"B1"}, {"A1"}, duplicated);

    ASSERT_EQ(assignment.pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(assignment.pairs[0].score, 0.6);
    EXPECT_EQ(assignment.pairs[0].match_count, 12);
}

TEST_F(PairSelectorTest, TiesBreakByBeforeThenAfterPath) {
    const std::vector<RankedCandidates> ties{
        ranked("B2", {candidate("A1", 0.5)}),
        ranked("B1", {candidate("A2", 0.5), candidate("A1", 0.5)}),
    };
    const PairSelector selector(selection(SelectionMode::GREEDY));
    const auto assignment = selector.select(befores, afters, ties);

    // B1-A1 wins the three-way tie, leaving B2 without a target
    ASSERT_EQ(assignment.pairs.size(), 1u);
    EXPECT_EQ(assignment.pairs[0].before_path, "B1");
    EXPECT_EQ(assignment.pairs[0].after_path, "A1");
    EXPECT_EQ(assignment.unmatched_before, std::vector<std::string>({"B2"}));
}

TEST_F(PairSelectorTest, PairsAndUnmatchedListsAreSorted) {
    const std::vector<std::string> many_before{"b3", "b1", "b2", "b4"};
    const std::vector<std::string> many_after{"a2", "a3", "a1"};
    const std::vector<RankedCandidates> input{
        ranked("b3", {candidate("a1", 0.9)}),
        ranked("b1", {candidate("a3", 0.8)}),
        ranked("b2", {candidate("a3", 0.3)}),
    };
    const PairSelector selector(selection(SelectionMode::GREEDY));
    const auto assignment = selector.select(many_before, many_after, input);

    ASSERT_EQ(assignment.pairs.size(), 2u);
    EXPECT_EQ(assignment.pairs[0].before_path, "b1");
    EXPECT_EQ(assignment.pairs[1].before_path, "b3");
    EXPECT_EQ(assignment.unmatched_before, std::vector<std::string>({"b2", "b4"}));
    EXPECT_EQ(assignment.unmatched_after, std::vector<std::string>({"a2"}));
}

TEST_F(PairSelectorTest, EmptyGroupYieldsEmptyAssignment) {
    const PairSelector selector(selection(SelectionMode::OPTIMAL));
    const auto assignment = selector.select({}, {}, {});
    EXPECT_TRUE(assignment.pairs.empty());
    EXPECT_TRUE(assignment.unmatched_before.empty());
    EXPECT_TRUE(assignment.unmatched_after.empty());
}

TEST_F(PairSelectorTest, RandomGroupsStayInjectiveAndOptimalNeverLoses) {
    cv::RNG rng(2024);
    const PairSelector greedy(selection(SelectionMode::GREEDY, 0.05));
    const PairSelector optimal(selection(SelectionMode::OPTIMAL, 0.05));

    for (int trial = 0; trial < 25; ++trial) {
        const int n_before = rng.uniform(1, 7);
        const int n_after = rng.uniform(1, 7);
        std::vector<std::string> bs, as;
        for (int i = 0; i < n_before; ++i) bs.push_back("b" + std::to_string(i));
        for (int j = 0; j < n_after; ++j) as.push_back("a" + std::to_string(j));

        std::vector<RankedCandidates> input;
        for (const auto& b : bs) {
            std::vector<MatchCandidate> candidates;
            for (const auto& a : as) {
                candidates.push_back(candidate(a, rng.uniform(0.0, 1.0)));
            }
            input.push_back(ranked(b, candidates));
        }

        const auto g = greedy.select(bs, as, input);
        const auto o = optimal.select(bs, as, input);

        for (const auto* assignment : {&g, &o}) {
            std::set<std::string> used_before, used_after;
            for (const auto& pair : assignment->pairs) {
                EXPECT_TRUE(used_before.insert(pair.before_path).second);
                EXPECT_TRUE(used_after.insert(pair.after_path).second);
                EXPECT_GE(pair.score, 0.05);
            }
            EXPECT_EQ(assignment->pairs.size() + assignment->unmatched_before.size(), bs.size());
            EXPECT_EQ(assignment->pairs.size() + assignment->unmatched_after.size(), as.size());
        }
        EXPECT_GE(totalScore(o) + 1e-9, totalScore(g)) << "trial " << trial;
    }
}

TEST(PairSelectorConfig, RejectsOutOfRangeMinScore) {
    EXPECT_THROW(PairSelector{selection(SelectionMode::GREEDY, -0.1)}, std::invalid_argument);
    EXPECT_THROW(PairSelector{selection(SelectionMode::GREEDY, 1.5)}, std::invalid_argument);
    EXPECT_NO_THROW(PairSelector{selection(SelectionMode::OPTIMAL, 1.0)});
}

TEST(SolveAssignment, FindsMinimumCost) {
    const std::vector<std::vector<double>> cost{
        {4.0, 1.0, 3.0},
        {2.0, 0.0, 5.0},
        {3.0, 2.0, 2.0},
    };
    const auto assignment = solveAssignment(cost);
    ASSERT_EQ(assignment.size(), 3u);
    EXPECT_EQ(assignment[0], 1);
    EXPECT_EQ(assignment[1], 0);
    EXPECT_EQ(assignment[2], 2);
}

TEST(SolveAssignment, HandlesEmptyAndRejectsNonSquare) {
    EXPECT_TRUE(solveAssignment({}).empty());
    const std::vector<std::vector<double>> ragged{{1.0, 2.0}, {3.0}};
    EXPECT_THROW(solveAssignment(ragged), std::invalid_argument);
}
