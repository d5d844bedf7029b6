// Copyright (c) MiXaiLL76
#include <gtest/gtest.h>

#include "detection_eval/geometry.h"
#include "detection_eval/matcher.h"
#include "test_helpers.h"

using namespace detection_eval::DetEval;
using detection_eval::DetEval::testing::Box;
using detection_eval::DetEval::testing::Gt;
using detection_eval::DetEval::testing::Pred;

TEST(MatcherTest, SortByConfidenceIsStable) {
        const std::vector<PredictionBox> preds = {
            Pred("a", "cat", Box(0, 0, 1, 1), 0.5),
            Pred("a", "cat", Box(0, 0, 1, 1), 0.9),
            Pred("a", "cat", Box(0, 0, 1, 1), 0.5),
            Pred("a", "cat", Box(0, 0, 1, 1), 0.7)};
        EXPECT_EQ(SortByConfidence(preds),
                  (std::vector<uint64_t>{1, 3, 0, 2}));
}

TEST(MatcherTest, HigherConfidenceTakesTheGroundTruth) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "cat", Box(0, 0, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "cat", Box(0, 0, 10, 10), 0.5),
            Pred("img", "cat", Box(0, 0, 10, 10), 0.9)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        ASSERT_EQ(matches.size(), 2u);
        EXPECT_EQ(matches[0].prediction, 1u);
        ASSERT_TRUE(matches[0].ground_truth.has_value());
        EXPECT_EQ(*matches[0].ground_truth, 0u);
        EXPECT_DOUBLE_EQ(matches[0].iou, 1.0);
        EXPECT_EQ(matches[1].prediction, 0u);
        EXPECT_FALSE(matches[1].ground_truth.has_value());
}

TEST(MatcherTest, EqualConfidenceKeepsInputOrder) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "cat", Box(0, 0, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "cat", Box(0, 0, 10, 10), 0.8),
            Pred("img", "cat", Box(0, 0, 10, 10), 0.8)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        ASSERT_EQ(matches.size(), 2u);
        EXPECT_EQ(matches[0].prediction, 0u);
        EXPECT_TRUE(matches[0].ground_truth.has_value());
        EXPECT_FALSE(matches[1].ground_truth.has_value());
}

TEST(MatcherTest, FirstGroundTruthWinsOnEqualIoU) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "cat", Box(0, 0, 10, 10)),
            Gt("img", "cat", Box(0, 0, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "cat", Box(0, 0, 10, 10), 0.9)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        ASSERT_TRUE(matches[0].ground_truth.has_value());
        EXPECT_EQ(*matches[0].ground_truth, 0u);
        EXPECT_EQ(UnmatchedGroundTruths(gts, matches),
                  (std::vector<uint64_t>{1}));
}

TEST(MatcherTest, ThresholdIsInclusive) {
        // Intersection 100, union 200.
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "cat", Box(0, 0, 10, 20))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "cat", Box(0, 0, 10, 10), 0.9)};

        EXPECT_TRUE(MatchGreedy(gts, preds, 0.5)[0].ground_truth.has_value());
        EXPECT_FALSE(MatchGreedy(gts, preds, 0.51)[0].ground_truth.has_value());
}

TEST(MatcherTest, MatchingIsScopedToSampleAndCategory) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img1", "cat", Box(0, 0, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img1", "dog", Box(0, 0, 10, 10), 0.9),
            Pred("img2", "cat", Box(0, 0, 10, 10), 0.8)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        EXPECT_FALSE(matches[0].ground_truth.has_value());
        EXPECT_FALSE(matches[1].ground_truth.has_value());
        EXPECT_EQ(UnmatchedGroundTruths(gts, matches).size(), 1u);
}

TEST(MatcherTest, AssignmentIsOneToOne) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "cat", Box(0, 0, 10, 10)),
            Gt("img", "cat", Box(50, 50, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "cat", Box(0, 0, 10, 10), 0.9),
            Pred("img", "cat", Box(1, 1, 10, 10), 0.8),
            Pred("img", "cat", Box(50, 50, 10, 10), 0.7)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        std::vector<int> uses(gts.size(), 0);
        int matched = 0;
        for (const auto &match : matches) {
                if (!match.ground_truth) continue;
                ++uses[*match.ground_truth];
                ++matched;
        }
        EXPECT_EQ(matched, 2);
        EXPECT_EQ(uses, (std::vector<int>{1, 1}));
        EXPECT_TRUE(UnmatchedGroundTruths(gts, matches).empty());
}

TEST(MatcherTest, CrowdRegionAbsorbsWithoutBeingConsumed) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "person", Box(0, 0, 100, 100), true),
            Gt("img", "person", Box(200, 200, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "person", Box(10, 10, 10, 10), 0.9),
            Pred("img", "person", Box(40, 40, 10, 10), 0.8),
            Pred("img", "person", Box(200, 200, 10, 10), 0.7)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        ASSERT_EQ(matches.size(), 3u);
        EXPECT_TRUE(matches[0].crowd);
        EXPECT_TRUE(matches[1].crowd);
        EXPECT_EQ(*matches[0].ground_truth, 0u);
        EXPECT_EQ(*matches[1].ground_truth, 0u);
        EXPECT_FALSE(matches[2].crowd);
        EXPECT_EQ(*matches[2].ground_truth, 1u);
        // Crowd regions are never false negatives.
        EXPECT_TRUE(UnmatchedGroundTruths(gts, matches).empty());
}

TEST(MatcherTest, NonCrowdCandidatePreferredOverCrowd) {
        const std::vector<GroundTruthBox> gts = {
            Gt("img", "person", Box(0, 0, 100, 100), true),
            Gt("img", "person", Box(10, 10, 10, 10))};
        const std::vector<PredictionBox> preds = {
            Pred("img", "person", Box(10, 10, 10, 10), 0.9)};

        const auto matches = MatchGreedy(gts, preds, 0.5);
        EXPECT_FALSE(matches[0].crowd);
        EXPECT_EQ(*matches[0].ground_truth, 1u);
}

TEST(MatcherTest, CrossCategorySearchFlagsLabelErrors) {
        // Two detections, two ground truths; same_category[d * G + g].
        const std::vector<BoundingBox> dt = {Box(0, 0, 10, 10),
                                             Box(50, 50, 10, 10)};
        const std::vector<BoundingBox> gt = {Box(0, 0, 10, 10),
                                             Box(50, 50, 10, 10)};
        const std::vector<bool> crowd = {false, false};
        const std::vector<bool> same_category = {true, false, true, false};

        GreedyAssignment assignment;
        MatchDetectionsToGroundTruth(ComputeIoUMatrix(dt, gt, crowd), 2, crowd,
                                     0.5, &same_category, &assignment);
        EXPECT_EQ(assignment.detection_matches,
                  (std::vector<int64_t>{0, 1}));
        EXPECT_FALSE(assignment.detection_label_errors[0]);
        EXPECT_TRUE(assignment.detection_label_errors[1]);
        EXPECT_EQ(assignment.ground_truth_consumed,
                  (std::vector<bool>{true, true}));

        // Without the mask every pair counts as same-category.
        MatchDetectionsToGroundTruth(ComputeIoUMatrix(dt, gt, crowd), 2, crowd,
                                     0.5, nullptr, &assignment);
        EXPECT_FALSE(assignment.detection_label_errors[1]);
}
