// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "confusion_matrix.h"
#include "params.h"
#include "types.h"

namespace detection_eval {
namespace DetEval {

// Name of the synthesized aggregate curve listed first in pr_curves.
constexpr const char *kAllCurveName = "all";
// Recall grid size of the aggregate curve.
constexpr std::size_t kAllCurveGridPoints = 101;

// Single point on a precision-recall curve.
struct PRPoint {
        double recall = 0.;
        double precision = 0.;
        double confidence = 0.;
};

// PR curve of one class, or of "all" for the aggregate plot line.
struct PRCurve {
        std::string class_name;
        std::vector<PRPoint> points;
        double ap = 0.;
};

// Mean AP over the classes that have ground truth.
struct APMetrics {
        double map50 = 0.;
        double map75 = 0.;
        double map50_95 = 0.;
};

// AP breakdown and precision/recall at the operating point for one class.
struct PerClassMetrics {
        std::string class_name;
        double ap50 = 0.;
        double ap75 = 0.;
        double ap50_95 = 0.;
        double precision = 0.;
        double recall = 0.;
        int64_t num_ground_truth = 0;  // non-crowd instances
        int64_t num_predictions = 0;
};

// Output of EvaluateDetection().
struct DetectionMetrics {
        std::vector<PRCurve> pr_curves;
        APMetrics ap_metrics;
        std::vector<PerClassMetrics> per_class_metrics;
};

// Full detection evaluation payload.
struct DetectionEvaluation {
        std::vector<PRCurve> pr_curves;
        APMetrics ap_metrics;
        std::vector<PerClassMetrics> per_class_metrics;
        ConfusionMatrix confusion_matrix;
        double iou_threshold = 0.5;
        double conf_threshold = 0.25;
};

// Stores intermediate results for one (sample, category) pair that has D
// detections and some ground truths, matched at each of T IoU thresholds.
struct ImageEvaluation {
        // For each threshold t and detection d (index t * D + d), the input
        // index of the matched ground truth, or -1 if unmatched
        std::vector<int64_t> detection_matches;

        // Marks detections absorbed by a crowd region at threshold t; they
        // count neither as true nor as false positives
        std::vector<bool> detection_ignores;

        // Input index and score of each detection, in descending confidence
        std::vector<uint64_t> detection_indices;
        std::vector<double> detection_scores;

        // Number of non-crowd ground truths
        int64_t num_ground_truth = 0;
};

template <class T>
using ImageCategoryInstances = std::vector<std::vector<std::vector<T>>>;

// For every combination of sample and category, matches the detections to the
// ground truths at each IoU threshold. The nested vectors hold indices into
// ground_truths / predictions:
//   image_category_ground_truths[i][c] are the ground truths of category c in
//     sample i, in input order
//   image_category_detections[i][c] are the predictions of category c in
//     sample i, in input order
// Result index: c * num_images + i.
std::vector<ImageEvaluation> EvaluateImages(
    const std::vector<double> &iou_thresholds,
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions,
    const ImageCategoryInstances<uint64_t> &image_category_ground_truths,
    const ImageCategoryInstances<uint64_t> &image_category_detections);

// Cumulative precision/recall after each detection of a confidence-sorted
// list, skipping ignored detections.
struct PrecisionRecall {
        std::vector<double> recalls;
        std::vector<double> precisions;
        std::vector<double> confidences;
};

PrecisionRecall ComputePrecisionRecall(const std::vector<bool> &true_positives,
                                       const std::vector<double> &scores,
                                       int64_t num_ground_truth);

// Interpolated AP: precision is made non-increasing from the right and
// sampled at each recall threshold (first point whose recall reaches it, or 0).
// Returns the mean of the sampled values; they are stored in interpolated
// when it is not null.
double InterpolatedAveragePrecision(const PrecisionRecall &curve,
                                    const std::vector<double> &recall_thresholds,
                                    std::vector<double> *interpolated = nullptr);

// Keeps at most max_points evenly spaced points (0 keeps all).
std::vector<PRPoint> DownsampleCurve(const PrecisionRecall &curve,
                                     std::size_t max_points);

// Aggregate curve: at each grid recall, the mean over non-empty class curves
// of the best precision at any recall >= the grid value, with the confidence
// of that point. Its ap is the mean precision of its points.
PRCurve SynthesizeAllCurve(const std::vector<PRCurve> &per_class_curves);

// Means of the per-class AP values over classes with ground truth.
APMetrics ComputeMapMetrics(const std::vector<PerClassMetrics> &per_class);

// PR curves at params.iou_threshold, AP at every IoU threshold and mAP.
// categories is the dataset category set; categories seen only in the rows
// are added.
DetectionMetrics EvaluateDetection(const std::vector<GroundTruthBox> &ground_truths,
                                   const std::vector<PredictionBox> &predictions,
                                   const std::vector<std::string> &categories,
                                   const Params &params);

}  // namespace DetEval
}  // namespace detection_eval
