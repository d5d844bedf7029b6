// Copyright (c) MiXaiLL76
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <variant>

#include "detection_eval/errors.h"
#include "detection_eval/evaluate.h"
#include "detection_eval/params.h"
#include "detection_eval/serialization.h"

using namespace detection_eval::DetEval;
using detection_eval::ValidationError;

namespace {

Dataset MakeDetectionDataset() {
        Dataset dataset("street", DatasetType::kDetection);
        dataset.add_category("bus");
        dataset.append({{"sample_id", "a"},
                        {"category_name", "cat"},
                        {"bbox", {0, 0, 10, 10}},
                        {"split", "val"}});
        dataset.append({{"sample_id", "b"},
                        {"category_name", "dog"},
                        {"bbox", {0, 0, 10, 10}},
                        {"split", "train"}});
        dataset.append({{"sample_id", "a"},
                        {"category_name", "cat"},
                        {"bbox", {0, 0, 10, 10}},
                        {"source", "model"},
                        {"confidence", 0.9}});
        dataset.append({{"sample_id", "b"},
                        {"category_name", "cat"},
                        {"bbox", {0, 0, 10, 10}},
                        {"source", "model"},
                        {"confidence", 0.8}});
        return dataset;
}

EvaluationRequest MakeRequest(const std::string &dataset_id = "street") {
        EvaluationRequest request;
        request.dataset_id = dataset_id;
        request.source = "model";
        return request;
}

}  // namespace

TEST(ParamsTest, DefaultsFollowCocoProtocol) {
        const Params params;
        ASSERT_EQ(params.iou_thresholds.size(), 10u);
        EXPECT_EQ(params.iou_thresholds.front(), 0.5);
        EXPECT_EQ(params.iou_thresholds.back(), 0.95);
        ASSERT_EQ(params.recall_thresholds.size(), 101u);
        EXPECT_EQ(params.recall_thresholds.front(), 0.0);
        EXPECT_EQ(params.recall_thresholds.back(), 1.0);
        EXPECT_EQ(params.iou_threshold, 0.5);
        EXPECT_EQ(params.conf_threshold, 0.25);
        EXPECT_EQ(params.max_samples_per_type, 50u);
        EXPECT_NO_THROW(params.Validate());
}

TEST(ParamsTest, LinspaceMatchesEvenSpacing) {
        const auto values = Linspace(0.0, 1.0, 5);
        EXPECT_EQ(values, (std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}));
        EXPECT_TRUE(Linspace(0.0, 1.0, 0).empty());
        EXPECT_EQ(Linspace(0.3, 1.0, 1), (std::vector<double>{0.3}));
}

TEST(ParamsTest, FromJsonReadsKnownKeys) {
        const Params params = Params::FromJson({{"iou_threshold", "0.6"},
                                                {"conf_threshold", 0.1},
                                                {"iou_thresholds", {0.5, 0.75}},
                                                {"recall_points", 11},
                                                {"max_samples_per_type", 5},
                                                {"max_curve_points", 0},
                                                {"source", "ignored"}});
        EXPECT_DOUBLE_EQ(params.iou_threshold, 0.6);
        EXPECT_DOUBLE_EQ(params.conf_threshold, 0.1);
        EXPECT_EQ(params.iou_thresholds, (std::vector<double>{0.5, 0.75}));
        EXPECT_EQ(params.recall_thresholds.size(), 11u);
        EXPECT_EQ(params.max_samples_per_type, 5u);
        EXPECT_EQ(params.max_curve_points, 0u);

        const json round = params.ToJson();
        EXPECT_EQ(round["recall_points"], 11);
        EXPECT_EQ(Params::FromJson(round).ToJson(), round);
}

TEST(ParamsTest, InvalidValuesAreRejected) {
        EXPECT_THROW(Params::FromJson({{"iou_threshold", 1.5}}), ValidationError);
        EXPECT_THROW(Params::FromJson({{"conf_threshold", -0.1}}),
                     ValidationError);
        EXPECT_THROW(Params::FromJson({{"conf_threshold", "abc"}}),
                     ValidationError);
        EXPECT_THROW(Params::FromJson({{"iou_thresholds", json::array()}}),
                     ValidationError);
        EXPECT_THROW(Params::FromJson({{"max_samples_per_type", -1}}),
                     ValidationError);
        EXPECT_THROW(Params::FromJson({{"recall_points", 1}}), ValidationError);
        EXPECT_THROW(Params::FromJson(json::array()), ValidationError);
        EXPECT_THROW(Params::FromJson({{"iou_threshold", "0.5abc"}}),
                     ValidationError);
        EXPECT_THROW(Params::FromJson({{"conf_threshold", ""}}),
                     ValidationError);

        Params params;
        params.iou_threshold = std::numeric_limits<double>::quiet_NaN();
        EXPECT_THROW(params.Validate(), ValidationError);
}

TEST(EvaluateTest, RequestValidation) {
        const Dataset dataset = MakeDetectionDataset();

        EXPECT_THROW(ValidateRequest(dataset, MakeRequest("")), ValidationError);
        EXPECT_THROW(ValidateRequest(dataset, MakeRequest("other")),
                     ValidationError);

        EvaluationRequest request = MakeRequest();
        request.source = "";
        EXPECT_THROW(ValidateRequest(dataset, request), ValidationError);
        request.source = "missing";
        EXPECT_THROW(ValidateRequest(dataset, request), ValidationError);
        request.source = kGroundTruthSource;
        EXPECT_THROW(ValidateRequest(dataset, request), ValidationError);

        request = MakeRequest();
        request.split = "test";
        EXPECT_THROW(ValidateRequest(dataset, request), ValidationError);

        request = MakeRequest();
        request.dataset_type = DatasetType::kClassification;
        EXPECT_THROW(ValidateRequest(dataset, request), ValidationError);

        request = MakeRequest();
        request.params.conf_threshold = 2.0;
        EXPECT_THROW(Evaluate(dataset, request), ValidationError);

        EXPECT_NO_THROW(ValidateRequest(dataset, MakeRequest()));
}

TEST(EvaluateTest, ValidationErrorIsInvalidArgument) {
        const Dataset dataset = MakeDetectionDataset();
        EXPECT_THROW(Evaluate(dataset, MakeRequest("other")),
                     std::invalid_argument);
}

TEST(EvaluateTest, DetectionDatasetGivesDetectionEvaluation) {
        const Dataset dataset = MakeDetectionDataset();
        const EvaluationResult result = Evaluate(dataset, MakeRequest());
        ASSERT_TRUE(std::holds_alternative<DetectionEvaluation>(result));

        const auto &evaluation = std::get<DetectionEvaluation>(result);
        EXPECT_EQ(evaluation.confusion_matrix.labels,
                  (std::vector<std::string>{"bus", "cat", "dog"}));
        // b: dog ground truth predicted as cat.
        EXPECT_EQ(evaluation.confusion_matrix.matrix[2][1], 1);
        EXPECT_EQ(evaluation.confusion_matrix.matrix[1][1], 1);
        EXPECT_EQ(evaluation.per_class_metrics.size(), 3u);
        EXPECT_DOUBLE_EQ(evaluation.ap_metrics.map50, 0.5);

        const json j = ResultToJson(result);
        EXPECT_EQ(j["evaluation_type"], "detection");
        EXPECT_EQ(j["confusion_matrix_labels"].size(), 3u);
        EXPECT_EQ(j["pr_curves"][0]["class_name"], "all");
        EXPECT_EQ(json(j.get<DetectionEvaluation>()), j);

        json mistyped = j;
        mistyped["evaluation_type"] = 3;
        EXPECT_THROW(mistyped.get<DetectionEvaluation>(), ValidationError);
        mistyped["evaluation_type"] = "classification";
        EXPECT_THROW(mistyped.get<DetectionEvaluation>(), ValidationError);
}

TEST(EvaluateTest, SplitRestrictsRows) {
        const Dataset dataset = MakeDetectionDataset();
        EvaluationRequest request = MakeRequest();
        request.split = "val";
        const auto evaluation =
            std::get<DetectionEvaluation>(Evaluate(dataset, request));
        EXPECT_DOUBLE_EQ(evaluation.ap_metrics.map50, 1.0);
}

TEST(EvaluateTest, ClassificationDatasetGivesClassificationEvaluation) {
        Dataset dataset("labels", DatasetType::kClassification);
        const char *actual[] = {"cat", "dog", "cat"};
        for (int i = 0; i < 3; ++i) {
                const std::string sid = "s" + std::to_string(i);
                dataset.append({{"sample_id", sid}, {"category_name", actual[i]}});
                dataset.append({{"sample_id", sid},
                                {"category_name", "cat"},
                                {"source", "clf"},
                                {"confidence", 0.9}});
        }

        EvaluationRequest request;
        request.dataset_id = "labels";
        request.source = "clf";
        const EvaluationResult result = Evaluate(dataset, request);
        ASSERT_TRUE(std::holds_alternative<ClassificationEvaluation>(result));
        const auto &evaluation = std::get<ClassificationEvaluation>(result);
        EXPECT_DOUBLE_EQ(evaluation.accuracy, 2.0 / 3.0);
        EXPECT_EQ(evaluation.confusion_matrix.matrix,
                  (std::vector<std::vector<int64_t>>{{2, 0}, {1, 0}}));

        const json j = ResultToJson(result);
        EXPECT_EQ(j["evaluation_type"], "classification");
        EXPECT_FALSE(j.contains("iou_threshold"));

        const ErrorAnalysis errors = AnalyzeErrors(dataset, request);
        EXPECT_EQ(errors.summary.true_positives, 2);
        EXPECT_EQ(errors.summary.label_errors, 1);
        EXPECT_EQ(ConfusionCellSamples(dataset, request, "dog", "cat"),
                  (std::vector<std::string>{"s1"}));
}

TEST(EvaluateTest, AnalyzeErrorsAndCellSamples) {
        const Dataset dataset = MakeDetectionDataset();
        const ErrorAnalysis errors = AnalyzeErrors(dataset, MakeRequest());
        EXPECT_EQ(errors.summary.true_positives, 1);
        EXPECT_EQ(errors.summary.label_errors, 1);
        EXPECT_EQ(errors.summary.false_negatives, 0);

        EXPECT_EQ(ConfusionCellSamples(dataset, MakeRequest(), "dog", "cat"),
                  (std::vector<std::string>{"b"}));
        EXPECT_EQ(ConfusionCellSamples(dataset, MakeRequest(), "cat", "cat"),
                  (std::vector<std::string>{"a"}));
        EXPECT_TRUE(
            ConfusionCellSamples(dataset, MakeRequest(), "cat", "dog").empty());

        const json j = errors;
        for (const char *key : {"tp", "hard_fp", "label_error", "fn"}) {
                EXPECT_TRUE(j["samples_by_type"].contains(key)) << key;
        }
        EXPECT_EQ(j["samples_by_type"]["fn"].size(), 0u);
}

TEST(EvaluateTest, RequestFromJson) {
        const EvaluationRequest request = RequestFromJson(
            {{"dataset_id", "street"},
             {"source", "model"},
             {"dataset_type", "detection"},
             {"split", "val"},
             {"iou_threshold", 0.75}});
        EXPECT_EQ(request.dataset_id, "street");
        ASSERT_TRUE(request.dataset_type.has_value());
        EXPECT_EQ(*request.dataset_type, DatasetType::kDetection);
        ASSERT_TRUE(request.split.has_value());
        EXPECT_EQ(*request.split, "val");
        EXPECT_EQ(request.params.iou_threshold, 0.75);

        EXPECT_THROW(RequestFromJson({{"source", "model"}}), ValidationError);
        EXPECT_THROW(RequestFromJson({{"dataset_id", "street"}, {"source", 3}}),
                     ValidationError);
}

TEST(EvaluateTest, WorstSamplesRankErroneousSamples) {
        const Dataset dataset = MakeDetectionDataset();
        const auto ranked = WorstSamples(dataset, MakeRequest());
        // a is a clean match, b holds a label error.
        ASSERT_EQ(ranked.size(), 1u);
        EXPECT_EQ(ranked[0].sample_id, "b");
        EXPECT_EQ(ranked[0].error_count, 1);

        const json j = ranked;
        EXPECT_EQ(j[0]["sample_id"], "b");
        EXPECT_TRUE(j[0].contains("confidence_spread"));

        EXPECT_THROW(WorstSamples(dataset, MakeRequest("other")),
                     ValidationError);
}

TEST(EvaluateTest, SampleAnnotationMatches) {
        const Dataset dataset = MakeDetectionDataset();
        const auto matches =
            SampleAnnotationMatches(dataset, MakeRequest(), "b");
        ASSERT_EQ(matches.size(), 2u);
        EXPECT_EQ(matches[0].annotation_id, "model/3");
        EXPECT_EQ(matches[0].label, AnnotationLabel::kLabelError);
        ASSERT_TRUE(matches[0].matched_id.has_value());
        EXPECT_EQ(*matches[0].matched_id, "ground_truth/1");
        EXPECT_TRUE(matches[1].is_ground_truth);
        EXPECT_EQ(matches[1].label, AnnotationLabel::kLabelError);

        const json j = matches;
        EXPECT_EQ(j[0]["label"], "label_error");
        EXPECT_EQ(j[1]["matched_id"], "model/3");

        EXPECT_THROW(SampleAnnotationMatches(dataset, MakeRequest(), "zzz"),
                     ValidationError);
}

TEST(EvaluateTest, TriageNeedsDetectionDataset) {
        Dataset dataset("labels", DatasetType::kClassification);
        dataset.append({{"sample_id", "s"}, {"category_name", "cat"}});
        dataset.append({{"sample_id", "s"},
                        {"category_name", "cat"},
                        {"source", "clf"}});
        EvaluationRequest request;
        request.dataset_id = "labels";
        request.source = "clf";
        EXPECT_THROW(WorstSamples(dataset, request), ValidationError);
        EXPECT_THROW(SampleAnnotationMatches(dataset, request, "s"),
                     ValidationError);
}
