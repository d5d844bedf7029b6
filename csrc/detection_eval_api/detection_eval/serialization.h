// Copyright (c) MiXaiLL76
#pragma once

#include <nlohmann/json.hpp>

#include "classification_evaluator.h"
#include "detection_evaluator.h"
#include "error_analysis.h"
#include "evaluate.h"

namespace detection_eval {
namespace DetEval {

using json = nlohmann::json;

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PRPoint, recall, precision, confidence)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PRCurve, class_name, points, ap)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(APMetrics, map50, map75, map50_95)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PerClassMetrics, class_name, ap50, ap75,
                                   ap50_95, precision, recall,
                                   num_ground_truth, num_predictions)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ClassificationPerClassMetrics, class_name,
                                   precision, recall, f1, support, missing)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ErrorSummary, true_positives,
                                   hard_false_positives, label_errors,
                                   false_negatives, crowd_matches)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PerClassErrors, class_name, tp, hard_fp,
                                   label_error, fn)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MatchedPair, sample_id, actual, predicted)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SampleScore, sample_id, error_count,
                                   confidence_spread, score)

// Evaluations carry "evaluation_type" and split the confusion matrix into
// "confusion_matrix" (rows) and "confusion_matrix_labels".
void to_json(json &j, const DetectionEvaluation &evaluation);
void from_json(const json &j, DetectionEvaluation &evaluation);
void to_json(json &j, const ClassificationEvaluation &evaluation);
void from_json(const json &j, ClassificationEvaluation &evaluation);

void to_json(json &j, const ErrorSample &sample);
void to_json(json &j, const ErrorAnalysis &analysis);
void to_json(json &j, const AnnotationMatch &match);

json ResultToJson(const EvaluationResult &result);

// Reads {dataset_id, source, dataset_type?, split?} plus the Params keys.
// Throws ValidationError on missing or mistyped fields.
EvaluationRequest RequestFromJson(const json &j);

}  // namespace DetEval
}  // namespace detection_eval
