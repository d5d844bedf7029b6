// Copyright (c) MiXaiLL76
#include "detection_evaluator.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <set>
#include <unordered_map>

#include "geometry.h"
#include "logger.h"
#include "matcher.h"

namespace detection_eval {
namespace DetEval {

namespace {

// Index of value in thresholds, or -1.
int FindThreshold(const std::vector<double> &thresholds, double value) {
        for (std::size_t t = 0; t < thresholds.size(); ++t) {
                if (std::fabs(thresholds[t] - value) < 1e-9)
                        return static_cast<int>(t);
        }
        return -1;
}

// Appends value to thresholds unless present, returns its index.
int EnsureThreshold(std::vector<double> *thresholds, double value) {
        int index = FindThreshold(*thresholds, value);
        if (index < 0) {
                thresholds->push_back(value);
                index = static_cast<int>(thresholds->size()) - 1;
        }
        return index;
}

// Detections of one category across all samples, sorted by descending score
// with the input index as tie-break.
// Arguments:
//   evaluations:        all ImageEvaluation results.
//   evaluation_index:   first evaluation of the category.
//   num_images:         number of samples.
//   evaluation_indices: output, evaluation of each detection.
//   image_detection_indices: output, position of each detection in its
//                       evaluation.
//   detection_scores:   output, score of each detection.
//   detection_sorted_indices: output, permutation sorted by score.
// Returns: number of non-crowd ground truths of the category.
int64_t BuildSortedDetectionList(
    const std::vector<ImageEvaluation> &evaluations,
    const std::size_t evaluation_index, const std::size_t num_images,
    std::vector<uint64_t> *evaluation_indices,
    std::vector<uint64_t> *image_detection_indices,
    std::vector<double> *detection_scores,
    std::vector<uint64_t> *detection_sorted_indices) {
        evaluation_indices->clear();
        image_detection_indices->clear();
        detection_scores->clear();
        std::vector<uint64_t> input_indices;

        int64_t num_valid_ground_truth = 0;
        for (std::size_t i = 0; i < num_images; ++i) {
                const ImageEvaluation &evaluation =
                    evaluations[evaluation_index + i];
                for (std::size_t d = 0; d < evaluation.detection_scores.size();
                     ++d) {
                        evaluation_indices->emplace_back(evaluation_index + i);
                        image_detection_indices->emplace_back(d);
                        detection_scores->emplace_back(
                            evaluation.detection_scores[d]);
                        input_indices.emplace_back(
                            evaluation.detection_indices[d]);
                }
                num_valid_ground_truth += evaluation.num_ground_truth;
        }

        detection_sorted_indices->resize(detection_scores->size());
        std::iota(detection_sorted_indices->begin(),
                  detection_sorted_indices->end(), 0);
        std::stable_sort(detection_sorted_indices->begin(),
                         detection_sorted_indices->end(),
                         [&detection_scores, &input_indices](uint64_t j1,
                                                             uint64_t j2) {
                                 const double s1 = (*detection_scores)[j1];
                                 const double s2 = (*detection_scores)[j2];
                                 if (s1 != s2) return s1 > s2;
                                 return input_indices[j1] < input_indices[j2];
                         });
        return num_valid_ground_truth;
}

}  // namespace

std::vector<ImageEvaluation> EvaluateImages(
    const std::vector<double> &iou_thresholds,
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions,
    const ImageCategoryInstances<uint64_t> &image_category_ground_truths,
    const ImageCategoryInstances<uint64_t> &image_category_detections) {
        const std::size_t num_images = image_category_ground_truths.size();
        const std::size_t num_categories =
            num_images > 0 ? image_category_ground_truths[0].size() : 0;
        const std::size_t num_iou_thresholds = iou_thresholds.size();

        std::vector<ImageEvaluation> results_all(num_images * num_categories);
        std::vector<BoundingBox> dt_boxes, gt_boxes;
        std::vector<bool> crowd;
        GreedyAssignment assignment;

        for (std::size_t i = 0; i < num_images; ++i) {
                for (std::size_t c = 0; c < num_categories; ++c) {
                        const auto &gt_indices =
                            image_category_ground_truths[i][c];
                        std::vector<uint64_t> dt_indices =
                            image_category_detections[i][c];
                        ImageEvaluation &results =
                            results_all[c * num_images + i];

                        // Sort detections by score (descending).
                        std::stable_sort(
                            dt_indices.begin(), dt_indices.end(),
                            [&predictions](uint64_t j1, uint64_t j2) {
                                    return predictions[j1].confidence >
                                           predictions[j2].confidence;
                            });

                        gt_boxes.clear();
                        crowd.clear();
                        for (uint64_t g : gt_indices) {
                                gt_boxes.push_back(ground_truths[g].bbox);
                                crowd.push_back(ground_truths[g].is_crowd);
                                if (!ground_truths[g].is_crowd)
                                        ++results.num_ground_truth;
                        }
                        dt_boxes.clear();
                        for (uint64_t p : dt_indices) {
                                dt_boxes.push_back(predictions[p].bbox);
                                results.detection_scores.push_back(
                                    predictions[p].confidence);
                        }
                        results.detection_indices = dt_indices;

                        const std::size_t num_detections = dt_indices.size();
                        results.detection_matches.assign(
                            num_iou_thresholds * num_detections, -1);
                        results.detection_ignores.assign(
                            num_iou_thresholds * num_detections, false);
                        if (num_detections == 0) continue;

                        const std::vector<double> ious =
                            ComputeIoUMatrix(dt_boxes, gt_boxes, crowd);

                        // Greedily match detections to ground truth per IOU
                        // threshold.
                        for (std::size_t t = 0; t < num_iou_thresholds; ++t) {
                                MatchDetectionsToGroundTruth(
                                    ious, num_detections, crowd,
                                    iou_thresholds[t], nullptr, &assignment);
                                for (std::size_t d = 0; d < num_detections;
                                     ++d) {
                                        const int64_t g =
                                            assignment.detection_matches[d];
                                        if (g < 0) continue;
                                        results.detection_matches
                                            [t * num_detections + d] =
                                            static_cast<int64_t>(gt_indices[g]);
                                        results.detection_ignores
                                            [t * num_detections + d] =
                                            assignment.detection_crowd[d];
                                }
                        }
                }
        }
        return results_all;
}

PrecisionRecall ComputePrecisionRecall(const std::vector<bool> &true_positives,
                                       const std::vector<double> &scores,
                                       int64_t num_ground_truth) {
        assert(true_positives.size() == scores.size());
        PrecisionRecall curve;
        curve.recalls.reserve(scores.size());
        curve.precisions.reserve(scores.size());
        curve.confidences.reserve(scores.size());

        int64_t true_positives_sum = 0, false_positives_sum = 0;
        for (std::size_t k = 0; k < true_positives.size(); ++k) {
                if (true_positives[k]) {
                        ++true_positives_sum;
                } else {
                        ++false_positives_sum;
                }
                curve.recalls.emplace_back(
                    SafeDivide(static_cast<double>(true_positives_sum),
                               static_cast<double>(num_ground_truth)));
                curve.precisions.emplace_back(SafeDivide(
                    static_cast<double>(true_positives_sum),
                    static_cast<double>(true_positives_sum +
                                        false_positives_sum)));
                curve.confidences.emplace_back(scores[k]);
        }
        return curve;
}

double InterpolatedAveragePrecision(const PrecisionRecall &curve,
                                    const std::vector<double> &recall_thresholds,
                                    std::vector<double> *interpolated) {
        // Make precision non-increasing (interpolated)
        std::vector<double> precisions = curve.precisions;
        for (int64_t i = static_cast<int64_t>(precisions.size()) - 1; i > 0;
             --i) {
                if (precisions[i] > precisions[i - 1]) {
                        precisions[i - 1] = precisions[i];
                }
        }

        if (interpolated != nullptr) {
                interpolated->assign(recall_thresholds.size(), 0.0);
        }
        if (recall_thresholds.empty()) return 0.0;

        // Sample the precision/recall lists at each recall threshold
        double sum = 0.0;
        for (std::size_t r = 0; r < recall_thresholds.size(); ++r) {
                // First index in recalls >= recall_thresholds[r]
                auto low = std::lower_bound(curve.recalls.begin(),
                                            curve.recalls.end(),
                                            recall_thresholds[r]);
                const std::size_t index =
                    static_cast<std::size_t>(low - curve.recalls.begin());
                const double value =
                    index < precisions.size() ? precisions[index] : 0.0;
                sum += value;
                if (interpolated != nullptr) (*interpolated)[r] = value;
        }
        return sum / static_cast<double>(recall_thresholds.size());
}

std::vector<PRPoint> DownsampleCurve(const PrecisionRecall &curve,
                                     std::size_t max_points) {
        const std::size_t n = curve.recalls.size();
        std::vector<std::size_t> indices;
        if (max_points == 0 || n <= max_points) {
                indices.resize(n);
                std::iota(indices.begin(), indices.end(), 0);
        } else {
                for (double position :
                     Linspace(0.0, static_cast<double>(n - 1), max_points)) {
                        indices.push_back(static_cast<std::size_t>(position));
                }
        }

        std::vector<PRPoint> points;
        points.reserve(indices.size());
        for (std::size_t k : indices) {
                points.push_back(PRPoint{curve.recalls[k], curve.precisions[k],
                                         curve.confidences[k]});
        }
        return points;
}

PRCurve SynthesizeAllCurve(const std::vector<PRCurve> &per_class_curves) {
        PRCurve all;
        all.class_name = kAllCurveName;

        for (double recall : Linspace(0.0, 1.0, kAllCurveGridPoints)) {
                double precision_sum = 0.0;
                double confidence_sum = 0.0;
                std::size_t count = 0;

                for (const auto &curve : per_class_curves) {
                        if (curve.points.empty()) continue;

                        // Best precision at recall >= grid point
                        double max_precision = 0.0;
                        double best_confidence = 0.0;
                        for (const auto &point : curve.points) {
                                if (point.recall >= recall &&
                                    point.precision > max_precision) {
                                        max_precision = point.precision;
                                        best_confidence = point.confidence;
                                }
                        }
                        precision_sum += max_precision;
                        confidence_sum += best_confidence;
                        ++count;
                }

                if (count > 0) {
                        const double n = static_cast<double>(count);
                        all.points.push_back(PRPoint{
                            recall, precision_sum / n, confidence_sum / n});
                }
        }

        double ap_sum = 0.0;
        for (const auto &point : all.points) ap_sum += point.precision;
        all.ap = SafeDivide(ap_sum, static_cast<double>(all.points.size()));
        return all;
}

APMetrics ComputeMapMetrics(const std::vector<PerClassMetrics> &per_class) {
        APMetrics metrics;
        std::size_t count = 0;
        for (const auto &m : per_class) {
                if (m.num_ground_truth <= 0) continue;
                metrics.map50 += m.ap50;
                metrics.map75 += m.ap75;
                metrics.map50_95 += m.ap50_95;
                ++count;
        }
        const double n = static_cast<double>(count);
        metrics.map50 = SafeDivide(metrics.map50, n);
        metrics.map75 = SafeDivide(metrics.map75, n);
        metrics.map50_95 = SafeDivide(metrics.map50_95, n);
        return metrics;
}

DetectionMetrics EvaluateDetection(const std::vector<GroundTruthBox> &ground_truths,
                                   const std::vector<PredictionBox> &predictions,
                                   const std::vector<std::string> &categories,
                                   const Params &params) {
        const std::vector<std::string> labels =
            SortedLabels(categories, ground_truths, predictions);

        // Thresholds averaged into ap50_95 come first; 0.5, 0.75 and the
        // operating threshold are appended when missing.
        std::vector<double> iou_thresholds = params.iou_thresholds;
        const std::size_t num_averaged = iou_thresholds.size();
        const int t50 = EnsureThreshold(&iou_thresholds, 0.5);
        const int t75 = EnsureThreshold(&iou_thresholds, 0.75);
        const int t_op = EnsureThreshold(&iou_thresholds, params.iou_threshold);

        // Samples in sorted id order, categories in label order.
        std::set<std::string> sample_set;
        for (const auto &gt : ground_truths) sample_set.insert(gt.sample_id);
        for (const auto &dt : predictions) sample_set.insert(dt.sample_id);
        std::unordered_map<std::string, std::size_t> sample_index;
        for (const auto &sid : sample_set)
                sample_index.emplace(sid, sample_index.size());
        std::unordered_map<std::string, std::size_t> category_index;
        for (const auto &label : labels)
                category_index.emplace(label, category_index.size());

        const std::size_t num_images = sample_set.size();
        const std::size_t num_categories = labels.size();

        ImageCategoryInstances<uint64_t> image_category_ground_truths(
            num_images, std::vector<std::vector<uint64_t>>(num_categories));
        ImageCategoryInstances<uint64_t> image_category_detections(
            num_images, std::vector<std::vector<uint64_t>>(num_categories));
        for (uint64_t g = 0; g < ground_truths.size(); ++g) {
                const auto &gt = ground_truths[g];
                image_category_ground_truths[sample_index.at(gt.sample_id)]
                                            [category_index.at(gt.category)]
                                                .push_back(g);
        }
        std::vector<int64_t> num_predictions(num_categories, 0);
        for (uint64_t p = 0; p < predictions.size(); ++p) {
                const auto &dt = predictions[p];
                const std::size_t c = category_index.at(dt.category);
                image_category_detections[sample_index.at(dt.sample_id)][c]
                    .push_back(p);
                ++num_predictions[c];
        }

        const std::vector<ImageEvaluation> evaluations = EvaluateImages(
            iou_thresholds, ground_truths, predictions,
            image_category_ground_truths, image_category_detections);

        DetectionMetrics metrics;
        std::vector<PRCurve> class_curves;
        std::vector<uint64_t> evaluation_indices, image_detection_indices,
            detection_sorted_indices;
        std::vector<double> detection_scores;
        std::vector<bool> true_positives;
        std::vector<double> scores;
        std::vector<double> ap(iou_thresholds.size(), 0.0);

        for (std::size_t c = 0; c < num_categories; ++c) {
                const int64_t num_valid_ground_truth = BuildSortedDetectionList(
                    evaluations, c * num_images, num_images,
                    &evaluation_indices, &image_detection_indices,
                    &detection_scores, &detection_sorted_indices);

                PrecisionRecall operating_curve;
                for (std::size_t t = 0; t < iou_thresholds.size(); ++t) {
                        true_positives.clear();
                        scores.clear();
                        for (uint64_t k : detection_sorted_indices) {
                                const ImageEvaluation &evaluation =
                                    evaluations[evaluation_indices[k]];
                                const std::size_t num_detections =
                                    evaluation.detection_scores.size();
                                const std::size_t index =
                                    t * num_detections +
                                    image_detection_indices[k];
                                if (evaluation.detection_ignores[index])
                                        continue;
                                true_positives.push_back(
                                    evaluation.detection_matches[index] >= 0);
                                scores.push_back(detection_scores[k]);
                        }

                        PrecisionRecall curve = ComputePrecisionRecall(
                            true_positives, scores, num_valid_ground_truth);
                        ap[t] = num_valid_ground_truth > 0
                                    ? InterpolatedAveragePrecision(
                                          curve, params.recall_thresholds)
                                    : 0.0;
                        if (static_cast<int>(t) == t_op)
                                operating_curve = std::move(curve);
                }

                PerClassMetrics m;
                m.class_name = labels[c];
                m.num_ground_truth = num_valid_ground_truth;
                m.num_predictions = num_predictions[c];
                m.ap50 = ap[t50];
                m.ap75 = ap[t75];
                double ap_sum = 0.0;
                for (std::size_t t = 0; t < num_averaged; ++t) ap_sum += ap[t];
                m.ap50_95 =
                    SafeDivide(ap_sum, static_cast<double>(num_averaged));

                // Operating point: cumulative values after the last
                // detection at or above the confidence threshold.
                for (std::size_t k = operating_curve.confidences.size(); k-- > 0;) {
                        if (operating_curve.confidences[k] >=
                            params.conf_threshold) {
                                m.precision = operating_curve.precisions[k];
                                m.recall = operating_curve.recalls[k];
                                break;
                        }
                }
                metrics.per_class_metrics.push_back(m);

                if (num_valid_ground_truth == 0 && num_predictions[c] == 0)
                        continue;
                PRCurve curve;
                curve.class_name = labels[c];
                curve.ap = ap[t_op];
                if (num_valid_ground_truth > 0) {
                        curve.points = DownsampleCurve(operating_curve,
                                                       params.max_curve_points);
                }
                class_curves.push_back(std::move(curve));
        }

        metrics.ap_metrics = ComputeMapMetrics(metrics.per_class_metrics);
        metrics.pr_curves.reserve(class_curves.size() + 1);
        metrics.pr_curves.push_back(SynthesizeAllCurve(class_curves));
        for (auto &curve : class_curves)
                metrics.pr_curves.push_back(std::move(curve));

        logger().debug(
            "evaluated {} ground truths and {} predictions over {} samples, "
            "{} categories, {} IoU thresholds: map50={:.4f} map50_95={:.4f}",
            ground_truths.size(), predictions.size(), num_images,
            num_categories, iou_thresholds.size(), metrics.ap_metrics.map50,
            metrics.ap_metrics.map50_95);
        return metrics;
}

}  // namespace DetEval
}  // namespace detection_eval
