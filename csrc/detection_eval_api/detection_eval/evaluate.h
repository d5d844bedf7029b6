// Copyright (c) MiXaiLL76
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "classification_evaluator.h"
#include "dataset.h"
#include "detection_evaluator.h"
#include "error_analysis.h"
#include "params.h"

namespace detection_eval {
namespace DetEval {

// One evaluation call against a dataset.
struct EvaluationRequest {
        std::string dataset_id;
        std::string source;
        // When set, must equal the dataset type
        std::optional<DatasetType> dataset_type;
        std::optional<std::string> split;
        Params params;
};

using EvaluationResult =
    std::variant<DetectionEvaluation, ClassificationEvaluation>;

// Throws ValidationError when the dataset id or source is empty or unknown,
// the dataset type does not match, the source has no predictions in the
// requested split, or a parameter is out of range.
void ValidateRequest(const Dataset &dataset, const EvaluationRequest &request);

// Detection metrics plus the confusion matrix at the operating point.
DetectionEvaluation EvaluateDetectionRows(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions,
    const std::vector<std::string> &categories, const Params &params);

// Detection datasets give a DetectionEvaluation, classification datasets a
// ClassificationEvaluation.
EvaluationResult Evaluate(const Dataset &dataset,
                          const EvaluationRequest &request);

// Error taxonomy at params.iou_threshold / params.conf_threshold.
ErrorAnalysis AnalyzeErrors(const Dataset &dataset,
                            const EvaluationRequest &request);

// Sorted ids of the samples contributing to one confusion matrix cell.
std::vector<std::string> ConfusionCellSamples(const Dataset &dataset,
                                              const EvaluationRequest &request,
                                              const std::string &actual,
                                              const std::string &predicted);

// Worst samples first, at most limit of them. Detection datasets only.
std::vector<SampleScore> WorstSamples(const Dataset &dataset,
                                      const EvaluationRequest &request,
                                      std::size_t limit = 50);

// Per-annotation matching of one sample. Detection datasets only; throws
// ValidationError for an unknown sample id.
std::vector<AnnotationMatch> SampleAnnotationMatches(
    const Dataset &dataset, const EvaluationRequest &request,
    const std::string &sample_id);

}  // namespace DetEval
}  // namespace detection_eval
