// Copyright (c) MiXaiLL76
#include <gtest/gtest.h>

#include <stdexcept>

#include "detection_eval/classification_evaluator.h"
#include "detection_eval/confusion_matrix.h"
#include "test_helpers.h"

using namespace detection_eval::DetEval;
using detection_eval::DetEval::testing::Box;
using detection_eval::DetEval::testing::Gt;
using detection_eval::DetEval::testing::Pred;

namespace {

LabelPair Pair(const std::string &sample_id, const std::string &actual,
               const std::string &predicted, double confidence = 0.9) {
        LabelPair pair;
        pair.sample_id = sample_id;
        pair.actual = actual;
        pair.predicted = predicted;
        pair.confidence = confidence;
        return pair;
}

LabelPair Missing(const std::string &sample_id, const std::string &actual) {
        LabelPair pair;
        pair.sample_id = sample_id;
        pair.actual = actual;
        return pair;
}

}  // namespace

TEST(ConfusionMatrixTest, CountsPairsByActualAndPredicted) {
        const ConfusionMatrix cm = BuildConfusionMatrix(
            {"cat", "dog"}, {{"cat", "cat"}, {"dog", "cat"}, {"cat", "cat"}});
        EXPECT_EQ(cm.matrix, (std::vector<std::vector<int64_t>>{{2, 0},
                                                                {1, 0}}));
        EXPECT_EQ(cm.row_sum(0), 2);
        EXPECT_EQ(cm.column_sum(0), 3);
        EXPECT_EQ(cm.trace(), 2);
        EXPECT_EQ(cm.total(), 3);
}

TEST(ConfusionMatrixTest, UnknownLabelThrows) {
        EXPECT_THROW(BuildConfusionMatrix({"cat"}, {{"cat", "dog"}}),
                     std::invalid_argument);
}

TEST(ConfusionMatrixTest, SelectLabelsKeepsBothAxes) {
        const ConfusionMatrix cm = BuildConfusionMatrix(
            {"a", "b", "c"}, {{"a", "b"}, {"c", "a"}, {"c", "c"}, {"b", "b"}});
        const ConfusionMatrix selected = SelectLabels(cm, {0, 2});
        EXPECT_EQ(selected.labels, (std::vector<std::string>{"a", "c"}));
        EXPECT_EQ(selected.matrix, (std::vector<std::vector<int64_t>>{{0, 0},
                                                                      {1, 1}}));
}

TEST(ClassificationEvaluatorTest, ThreeSampleExample) {
        const std::vector<LabelPair> pairs = {Pair("s1", "cat", "cat"),
                                              Pair("s2", "dog", "cat"),
                                              Pair("s3", "cat", "cat")};
        const auto result = EvaluateClassification(pairs, {}, 0.25);

        EXPECT_EQ(result.confusion_matrix.labels,
                  (std::vector<std::string>{"cat", "dog"}));
        EXPECT_EQ(result.confusion_matrix.matrix,
                  (std::vector<std::vector<int64_t>>{{2, 0}, {1, 0}}));
        EXPECT_DOUBLE_EQ(result.accuracy, 2.0 / 3.0);

        const auto &cat = result.per_class_metrics[0];
        const auto &dog = result.per_class_metrics[1];
        EXPECT_DOUBLE_EQ(cat.precision, 2.0 / 3.0);
        EXPECT_DOUBLE_EQ(cat.recall, 1.0);
        EXPECT_NEAR(cat.f1, 0.8, 1e-12);
        EXPECT_EQ(cat.support, 2);
        EXPECT_EQ(dog.recall, 0.0);
        EXPECT_EQ(dog.precision, 0.0);
        EXPECT_EQ(dog.f1, 0.0);
        EXPECT_EQ(dog.support, 1);
        EXPECT_NEAR(result.macro_f1, 0.4, 1e-12);
        EXPECT_NEAR(result.weighted_f1, 0.8 * 2.0 / 3.0, 1e-12);
}

TEST(ClassificationEvaluatorTest, MissingPredictionsStayOutsideTheMatrix) {
        const std::vector<LabelPair> pairs = {Pair("s1", "cat", "cat"),
                                              Missing("s2", "cat"),
                                              Missing("s3", "dog")};
        const auto result = EvaluateClassification(pairs, {}, 0.5);

        EXPECT_EQ(result.confusion_matrix.total(), 1);
        EXPECT_DOUBLE_EQ(result.accuracy, 1.0);
        EXPECT_EQ(result.per_class_metrics[0].support, 1);
        EXPECT_EQ(result.per_class_metrics[0].missing, 1);
        EXPECT_EQ(result.per_class_metrics[1].support, 0);
        EXPECT_EQ(result.per_class_metrics[1].missing, 1);
        EXPECT_EQ(result.conf_threshold, 0.5);
}

TEST(ClassificationEvaluatorTest, UnobservedCategoriesDoNotDiluteMacroF1) {
        const std::vector<LabelPair> pairs = {Pair("s1", "cat", "cat")};
        const auto result = EvaluateClassification(pairs, {"bird", "cat"}, 0.25);
        ASSERT_EQ(result.per_class_metrics.size(), 2u);
        EXPECT_EQ(result.per_class_metrics[0].class_name, "bird");
        EXPECT_DOUBLE_EQ(result.macro_f1, 1.0);
        EXPECT_DOUBLE_EQ(result.weighted_f1, 1.0);
}

TEST(ClassificationEvaluatorTest, EmptyInputGivesZeros) {
        const auto result = EvaluateClassification({}, {"cat"}, 0.25);
        EXPECT_EQ(result.accuracy, 0.0);
        EXPECT_EQ(result.macro_f1, 0.0);
        EXPECT_EQ(result.weighted_f1, 0.0);
}

TEST(PairClassificationLabelsTest, PicksSmallestLabelAndBestPrediction) {
        const std::vector<GroundTruthBox> gts = {
            Gt("s2", "zebra", Box(0, 0, 0, 0)), Gt("s2", "ant", Box(0, 0, 0, 0)),
            Gt("s1", "cat", Box(0, 0, 0, 0))};
        const std::vector<PredictionBox> preds = {
            Pred("s1", "dog", Box(0, 0, 0, 0), 0.6),
            Pred("s1", "cat", Box(0, 0, 0, 0), 0.6),
            Pred("s1", "bird", Box(0, 0, 0, 0), 0.1),
            Pred("s2", "ant", Box(0, 0, 0, 0), 0.2),
            Pred("s3", "cat", Box(0, 0, 0, 0), 0.9)};

        const auto pairs = PairClassificationLabels(gts, preds, 0.25);
        ASSERT_EQ(pairs.size(), 2u);
        EXPECT_EQ(pairs[0].sample_id, "s1");
        EXPECT_EQ(pairs[0].actual, "cat");
        ASSERT_TRUE(pairs[0].predicted.has_value());
        // Equal confidence: first in input order.
        EXPECT_EQ(*pairs[0].predicted, "dog");
        EXPECT_EQ(pairs[1].actual, "ant");
        EXPECT_FALSE(pairs[1].predicted.has_value());
        EXPECT_FALSE(pairs[1].confidence.has_value());
}

TEST(ClassificationErrorsTest, CorrectMisclassifiedMissing) {
        const std::vector<LabelPair> pairs = {Pair("s1", "cat", "cat"),
                                              Pair("s2", "dog", "cat"),
                                              Missing("s3", "dog")};
        const auto analysis = CategorizeClassificationErrors(pairs, {}, 50);

        EXPECT_EQ(analysis.summary.true_positives, 1);
        EXPECT_EQ(analysis.summary.label_errors, 1);
        EXPECT_EQ(analysis.summary.false_negatives, 1);
        EXPECT_EQ(analysis.summary.hard_false_positives, 0);
        EXPECT_EQ(analysis.per_class[1].class_name, "dog");
        EXPECT_EQ(analysis.per_class[1].label_error, 1);
        EXPECT_EQ(analysis.per_class[1].fn, 1);
        EXPECT_EQ(analysis.samples_by_type.at("label_error")[0].category_name,
                  "cat");
        EXPECT_TRUE(analysis.samples_by_type.at("hard_fp").empty());
        EXPECT_EQ(analysis.matched_pairs.size(), 2u);

        const auto capped = CategorizeClassificationErrors(pairs, {}, 0);
        EXPECT_TRUE(capped.samples_by_type.at("tp").empty());
        EXPECT_EQ(capped.summary.true_positives, 1);
}
