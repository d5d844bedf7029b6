// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <vector>

#include "types.h"

namespace detection_eval {
namespace DetEval {

// Outcome of greedily matching the D detections of one group (one sample, and
// one category unless matching across categories) against its G ground
// truths at a single IoU threshold.
struct GreedyAssignment {
        // For each detection, the matched ground-truth column, or -1
        std::vector<int64_t> detection_matches;
        // IoU of each detection with its match, 0 when unmatched
        std::vector<double> detection_ious;
        // Marks detections absorbed by a crowd region
        std::vector<bool> detection_crowd;
        // Marks detections matched to a ground truth of another category
        std::vector<bool> detection_label_errors;
        // Marks ground truths consumed by a detection
        std::vector<bool> ground_truth_consumed;
};

// Sorts predictions from highest to lowest confidence using stable_sort, so
// equal confidences keep their input order.
std::vector<uint64_t> SortByConfidence(
    const std::vector<PredictionBox> &predictions);

// Greedy matching of one group.
// Arguments:
//   ious:           D x G IoU values (row-major), detections in the order they
//                   are to be processed (descending confidence).
//   num_detections: D.
//   crowd:          G flags marking crowd regions.
//   threshold:      IoU threshold; a match needs IoU >= threshold.
//   same_category:  optional D x G flags. When null, every pair is treated as
//                   same-category. When set, ground truths of every category
//                   compete and a match against another category is recorded
//                   as a label error.
//   results:        output assignment.
// Each detection takes the unconsumed non-crowd ground truth of maximum IoU
// (first one on ties). When none reaches the threshold, a same-category crowd
// region reaching it absorbs the detection without being consumed.
void MatchDetectionsToGroundTruth(const std::vector<double> &ious,
                                  std::size_t num_detections,
                                  const std::vector<bool> &crowd,
                                  double threshold,
                                  const std::vector<bool> *same_category,
                                  GreedyAssignment *results);

// Greedy one-to-one matching of predictions to ground truths of the same
// sample and category. Returns one Match per prediction, in processing order
// (descending confidence, input order on ties).
std::vector<Match> MatchGreedy(const std::vector<GroundTruthBox> &ground_truths,
                               const std::vector<PredictionBox> &predictions,
                               double iou_threshold);

// Indices of non-crowd ground truths not consumed by any of the matches.
std::vector<uint64_t> UnmatchedGroundTruths(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<Match> &matches);

}  // namespace DetEval
}  // namespace detection_eval
