// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "confusion_matrix.h"
#include "error_analysis.h"
#include "types.h"

namespace detection_eval {
namespace DetEval {

// Ground-truth label of a sample and the label predicted for it, if any.
struct LabelPair {
        std::string sample_id;
        std::string actual;
        std::optional<std::string> predicted;
        std::optional<double> confidence;
};

struct ClassificationPerClassMetrics {
        std::string class_name;
        double precision = 0.;
        double recall = 0.;
        double f1 = 0.;
        int64_t support = 0;  // row sum of the confusion matrix
        int64_t missing = 0;  // samples of the class without a prediction
};

struct ClassificationEvaluation {
        double accuracy = 0.;
        double macro_f1 = 0.;
        double weighted_f1 = 0.;
        std::vector<ClassificationPerClassMetrics> per_class_metrics;
        ConfusionMatrix confusion_matrix;
        double conf_threshold = 0.25;
};

// One pair per sample with ground truth, in sorted sample id order. The
// actual label is the smallest ground-truth category of the sample; the
// predicted label is the most confident prediction with confidence >=
// conf_threshold (first in input order on ties).
std::vector<LabelPair> PairClassificationLabels(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, double conf_threshold);

// Accuracy, macro/weighted F1 and per-class precision, recall and F1 from the
// confusion matrix of the pairs that have a prediction. Labels are the
// categories plus every observed label, sorted.
ClassificationEvaluation EvaluateClassification(
    const std::vector<LabelPair> &pairs,
    const std::vector<std::string> &categories, double conf_threshold);

// Correct -> tp, misclassified -> label_error (by actual class), no
// prediction -> fn.
ErrorAnalysis CategorizeClassificationErrors(
    const std::vector<LabelPair> &pairs,
    const std::vector<std::string> &categories,
    std::size_t max_samples_per_type);

}  // namespace DetEval
}  // namespace detection_eval
