// Copyright (c) MiXaiLL76
#include "matcher.h"

#include <algorithm>
#include <cassert>
#include <numeric>
#include <unordered_map>
#include <utility>

#include "geometry.h"

namespace detection_eval {
namespace DetEval {

namespace {

enum class CandidateKind { kRegular, kSameCategoryCrowd };

// Column of the best candidate of the given kind for detection d, or -1.
// Strict comparison keeps the first ground truth on equal IoU.
int64_t FindBestCandidate(const std::vector<double> &ious, std::size_t d,
                          std::size_t num_ground_truth,
                          const std::vector<bool> &crowd,
                          const std::vector<bool> &consumed,
                          const std::vector<bool> *same_category,
                          CandidateKind kind, double *best_iou) {
        int64_t match = -1;
        *best_iou = -1.0;
        for (std::size_t g = 0; g < num_ground_truth; ++g) {
                const bool is_crowd = crowd[g];
                const bool same =
                    same_category == nullptr ||
                    (*same_category)[d * num_ground_truth + g];
                switch (kind) {
                        case CandidateKind::kRegular:
                                if (is_crowd || consumed[g]) continue;
                                break;
                        case CandidateKind::kSameCategoryCrowd:
                                if (!is_crowd || !same) continue;
                                break;
                }
                const double iou = ious[d * num_ground_truth + g];
                if (iou > *best_iou) {
                        *best_iou = iou;
                        match = static_cast<int64_t>(g);
                }
        }
        return match;
}

}  // namespace

std::vector<uint64_t> SortByConfidence(
    const std::vector<PredictionBox> &predictions) {
        std::vector<uint64_t> sorted_indices(predictions.size());
        std::iota(sorted_indices.begin(), sorted_indices.end(), 0);

        std::stable_sort(sorted_indices.begin(), sorted_indices.end(),
                         [&predictions](uint64_t j1, uint64_t j2) {
                                 return predictions[j1].confidence >
                                        predictions[j2].confidence;
                         });
        return sorted_indices;
}

void MatchDetectionsToGroundTruth(const std::vector<double> &ious,
                                  std::size_t num_detections,
                                  const std::vector<bool> &crowd,
                                  double threshold,
                                  const std::vector<bool> *same_category,
                                  GreedyAssignment *results) {
        const std::size_t num_ground_truth = crowd.size();
        assert(ious.size() == num_detections * num_ground_truth);

        results->detection_matches.assign(num_detections, -1);
        results->detection_ious.assign(num_detections, 0.0);
        results->detection_crowd.assign(num_detections, false);
        results->detection_label_errors.assign(num_detections, false);
        results->ground_truth_consumed.assign(num_ground_truth, false);
        std::vector<bool> &consumed = results->ground_truth_consumed;

        for (std::size_t d = 0; d < num_detections; ++d) {
                double best_iou = -1.0;
                int64_t match = FindBestCandidate(
                    ious, d, num_ground_truth, crowd, consumed, same_category,
                    CandidateKind::kRegular, &best_iou);

                if (match >= 0 && best_iou >= threshold) {
                        assert(!consumed[match]);
                        consumed[match] = true;
                        results->detection_label_errors[d] =
                            same_category != nullptr &&
                            !(*same_category)[d * num_ground_truth + match];
                        results->detection_matches[d] = match;
                        results->detection_ious[d] = best_iou;
                        continue;
                }

                match = FindBestCandidate(ious, d, num_ground_truth, crowd,
                                          consumed, same_category,
                                          CandidateKind::kSameCategoryCrowd,
                                          &best_iou);
                if (match >= 0 && best_iou >= threshold) {
                        results->detection_matches[d] = match;
                        results->detection_ious[d] = best_iou;
                        results->detection_crowd[d] = true;
                }
        }
}

std::vector<Match> MatchGreedy(const std::vector<GroundTruthBox> &ground_truths,
                               const std::vector<PredictionBox> &predictions,
                               double iou_threshold) {
        using Key = std::pair<std::string, std::string>;

        // Ground truths per (sample, category), in input order.
        std::unordered_map<Key, std::vector<uint64_t>, hash_pair> gt_groups;
        for (uint64_t g = 0; g < ground_truths.size(); ++g) {
                const auto &gt = ground_truths[g];
                gt_groups[{gt.sample_id, gt.category}].push_back(g);
        }

        // Predictions per (sample, category), in confidence order.
        const std::vector<uint64_t> order = SortByConfidence(predictions);
        std::unordered_map<Key, std::vector<uint64_t>, hash_pair> dt_groups;
        for (uint64_t p : order) {
                const auto &dt = predictions[p];
                dt_groups[{dt.sample_id, dt.category}].push_back(p);
        }

        std::vector<std::optional<uint64_t>> matched(predictions.size());
        std::vector<double> matched_iou(predictions.size(), 0.0);
        std::vector<bool> matched_crowd(predictions.size(), false);

        GreedyAssignment assignment;
        std::vector<BoundingBox> dt_boxes, gt_boxes;
        std::vector<bool> crowd;
        for (const auto &kv : dt_groups) {
                const std::vector<uint64_t> &dt_indices = kv.second;
                auto it = gt_groups.find(kv.first);
                if (it == gt_groups.end()) continue;
                const std::vector<uint64_t> &gt_indices = it->second;

                dt_boxes.clear();
                gt_boxes.clear();
                crowd.clear();
                for (uint64_t p : dt_indices)
                        dt_boxes.push_back(predictions[p].bbox);
                for (uint64_t g : gt_indices) {
                        gt_boxes.push_back(ground_truths[g].bbox);
                        crowd.push_back(ground_truths[g].is_crowd);
                }

                MatchDetectionsToGroundTruth(
                    ComputeIoUMatrix(dt_boxes, gt_boxes, crowd),
                    dt_indices.size(), crowd, iou_threshold, nullptr,
                    &assignment);

                for (std::size_t d = 0; d < dt_indices.size(); ++d) {
                        const int64_t g = assignment.detection_matches[d];
                        if (g < 0) continue;
                        const uint64_t p = dt_indices[d];
                        matched[p] = gt_indices[g];
                        matched_iou[p] = assignment.detection_ious[d];
                        matched_crowd[p] = assignment.detection_crowd[d];
                }
        }

        std::vector<Match> matches;
        matches.reserve(predictions.size());
        for (uint64_t p : order) {
                matches.emplace_back(p, matched[p], matched_iou[p],
                                     matched_crowd[p]);
        }
        return matches;
}

std::vector<uint64_t> UnmatchedGroundTruths(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<Match> &matches) {
        std::vector<bool> consumed(ground_truths.size(), false);
        for (const auto &match : matches) {
                if (!match.ground_truth || match.crowd) continue;
                assert(!consumed[*match.ground_truth]);
                consumed[*match.ground_truth] = true;
        }

        std::vector<uint64_t> unmatched;
        for (uint64_t g = 0; g < ground_truths.size(); ++g) {
                if (!consumed[g] && !ground_truths[g].is_crowd)
                        unmatched.push_back(g);
        }
        return unmatched;
}

}  // namespace DetEval
}  // namespace detection_eval
