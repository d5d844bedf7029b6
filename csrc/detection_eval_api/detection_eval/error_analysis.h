// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "confusion_matrix.h"
#include "types.h"

namespace detection_eval {
namespace DetEval {

enum class ErrorType { kTruePositive, kHardFalsePositive, kLabelError, kFalseNegative };

// Key of the error type in samples_by_type: tp, hard_fp, label_error, fn.
const char *ErrorTypeKey(ErrorType type);

// One exemplar of an error type.
struct ErrorSample {
        std::string sample_id;
        ErrorType error_type = ErrorType::kTruePositive;
        std::string category_name;
        std::optional<double> confidence;  // empty for false negatives
};

struct ErrorSummary {
        int64_t true_positives = 0;
        int64_t hard_false_positives = 0;
        int64_t label_errors = 0;
        int64_t false_negatives = 0;
        // Predictions absorbed by a crowd region, outside the four types
        int64_t crowd_matches = 0;
};

struct PerClassErrors {
        std::string class_name;
        int64_t tp = 0;
        int64_t hard_fp = 0;
        int64_t label_error = 0;
        int64_t fn = 0;
};

// Ground-truth and predicted category of a true positive or label error.
struct MatchedPair {
        std::string sample_id;
        std::string actual;
        std::string predicted;
};

struct ErrorAnalysis {
        ErrorSummary summary;
        std::vector<PerClassErrors> per_class;
        std::map<std::string, std::vector<ErrorSample>> samples_by_type;
        std::vector<MatchedPair> matched_pairs;
};

// Buckets predictions with confidence >= conf_threshold and non-crowd ground
// truths into true positives, hard false positives, label errors and false
// negatives at a single IoU threshold. Samples are processed in sorted id
// order, predictions of a sample in descending confidence. Each prediction
// takes the unconsumed non-crowd ground truth of highest IoU over every
// category: a true positive when the categories agree, a label error
// otherwise. At most max_samples_per_type exemplars are kept per type.
ErrorAnalysis CategorizeErrors(const std::vector<GroundTruthBox> &ground_truths,
                               const std::vector<PredictionBox> &predictions,
                               const std::vector<std::string> &categories,
                               double iou_threshold, double conf_threshold,
                               std::size_t max_samples_per_type);

// Samples ranked worst first by
//   0.6 * error_count / max_error_count + 0.4 * spread / max_spread
// where error_count counts the hard false positives, label errors and false
// negatives of a sample and spread is the population standard deviation of
// the confidences of its erroneous predictions (0 with fewer than two).
// Samples without errors are left out; equal scores keep sample id order.
struct SampleScore {
        std::string sample_id;
        int64_t error_count = 0;
        double confidence_spread = 0.;
        double score = 0.;
};

std::vector<SampleScore> RankWorstSamples(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, double iou_threshold,
    double conf_threshold, std::size_t limit);

enum class AnnotationLabel {
        kTruePositive,
        kLabelError,
        kFalsePositive,
        kFalseNegative,
        kCrowd
};

// tp, label_error, fp, fn, crowd
const char *AnnotationLabelKey(AnnotationLabel label);

// Outcome of one annotation of a sample. A matched ground truth carries the
// label of the prediction that took it; a crowd region is labelled crowd.
struct AnnotationMatch {
        std::string annotation_id;
        bool is_ground_truth = false;
        AnnotationLabel label = AnnotationLabel::kFalsePositive;
        std::optional<std::string> matched_id;
        std::optional<double> iou;
};

// Per-annotation matching of one sample with the same rules as
// CategorizeErrors. Predictions come first in processing order, then the
// ground truths in input order. Predictions below conf_threshold are left
// out.
std::vector<AnnotationMatch> MatchSampleAnnotations(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, const std::string &sample_id,
    double iou_threshold, double conf_threshold);

// Detection confusion matrix over labels: diagonal counts true positives,
// off-diagonal cells count label errors.
ConfusionMatrix BuildDetectionConfusionMatrix(
    const std::vector<std::string> &labels,
    const std::vector<MatchedPair> &matched_pairs);

// Distinct sorted sample ids with a matched pair (actual, predicted).
std::vector<std::string> CellSampleIds(
    const std::vector<MatchedPair> &matched_pairs, const std::string &actual,
    const std::string &predicted);

}  // namespace DetEval
}  // namespace detection_eval
