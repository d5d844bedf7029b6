// Copyright (c) MiXaiLL76
#include "error_analysis.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <unordered_map>
#include <utility>

#include "geometry.h"
#include "logger.h"
#include "matcher.h"

namespace detection_eval {
namespace DetEval {

namespace {

// Keeps at most cap exemplars per error type.
class SampleCollector {
       public:
        explicit SampleCollector(std::size_t cap) : cap_(cap) {
                for (ErrorType type :
                     {ErrorType::kTruePositive, ErrorType::kHardFalsePositive,
                      ErrorType::kLabelError, ErrorType::kFalseNegative}) {
                        samples_[ErrorTypeKey(type)];
                }
        }

        void add(const std::string &sample_id, ErrorType type,
                 const std::string &category, std::optional<double> confidence) {
                auto &list = samples_[ErrorTypeKey(type)];
                if (list.size() >= cap_) return;
                list.push_back(ErrorSample{sample_id, type, category, confidence});
        }

        std::map<std::string, std::vector<ErrorSample>> release() {
                return std::move(samples_);
        }

       private:
        std::size_t cap_;
        std::map<std::string, std::vector<ErrorSample>> samples_;
};

// Matches the kept predictions of one sample (dt_indices, in processing
// order) against its ground truths, across categories.
void MatchSample(const std::vector<GroundTruthBox> &ground_truths,
                 const std::vector<uint64_t> &gt_indices,
                 const std::vector<PredictionBox> &predictions,
                 const std::vector<uint64_t> &dt_indices, double iou_threshold,
                 GreedyAssignment *assignment) {
        std::vector<BoundingBox> dt_boxes, gt_boxes;
        std::vector<bool> crowd, same_category;
        for (uint64_t g : gt_indices) {
                gt_boxes.push_back(ground_truths[g].bbox);
                crowd.push_back(ground_truths[g].is_crowd);
        }
        for (uint64_t p : dt_indices) {
                dt_boxes.push_back(predictions[p].bbox);
                for (uint64_t g : gt_indices) {
                        same_category.push_back(predictions[p].category ==
                                                ground_truths[g].category);
                }
        }
        MatchDetectionsToGroundTruth(ComputeIoUMatrix(dt_boxes, gt_boxes, crowd),
                                     dt_indices.size(), crowd, iou_threshold,
                                     &same_category, assignment);
}

// Outcome of one kept prediction or one non-crowd ground truth.
struct Outcome {
        const std::string *sample_id = nullptr;
        ErrorType type = ErrorType::kTruePositive;
        bool crowd = false;  // prediction absorbed by a crowd region
        const GroundTruthBox *ground_truth = nullptr;
        const PredictionBox *prediction = nullptr;
};

// Outcomes per sample in sorted id order: the predictions of a sample in
// descending confidence, then its unconsumed ground truths.
std::vector<Outcome> CollectOutcomes(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, double iou_threshold,
    double conf_threshold, std::size_t *num_samples, int64_t *num_kept) {
        std::map<std::string, std::vector<uint64_t>> gt_by_sample;
        std::map<std::string, std::vector<uint64_t>> dt_by_sample;
        for (uint64_t g = 0; g < ground_truths.size(); ++g) {
                gt_by_sample[ground_truths[g].sample_id].push_back(g);
        }
        *num_kept = 0;
        for (uint64_t p : SortByConfidence(predictions)) {
                if (predictions[p].confidence < conf_threshold) continue;
                dt_by_sample[predictions[p].sample_id].push_back(p);
                ++*num_kept;
        }
        std::set<std::string> sample_ids;
        for (const auto &kv : gt_by_sample) sample_ids.insert(kv.first);
        for (const auto &kv : dt_by_sample) sample_ids.insert(kv.first);
        *num_samples = sample_ids.size();

        std::vector<Outcome> outcomes;
        GreedyAssignment assignment;
        const std::vector<uint64_t> none;
        for (const auto &sid : sample_ids) {
                auto gt_it = gt_by_sample.find(sid);
                auto dt_it = dt_by_sample.find(sid);
                const auto &gt_indices =
                    gt_it == gt_by_sample.end() ? none : gt_it->second;
                const auto &dt_indices =
                    dt_it == dt_by_sample.end() ? none : dt_it->second;
                // Outcomes point into the input rows, never into sample_ids.
                MatchSample(ground_truths, gt_indices, predictions, dt_indices,
                            iou_threshold, &assignment);

                for (std::size_t d = 0; d < dt_indices.size(); ++d) {
                        Outcome outcome;
                        outcome.prediction = &predictions[dt_indices[d]];
                        outcome.sample_id = &outcome.prediction->sample_id;
                        const int64_t g = assignment.detection_matches[d];
                        if (g < 0) {
                                outcome.type = ErrorType::kHardFalsePositive;
                        } else {
                                outcome.ground_truth =
                                    &ground_truths[gt_indices[g]];
                                outcome.crowd = assignment.detection_crowd[d];
                                outcome.type =
                                    assignment.detection_label_errors[d]
                                        ? ErrorType::kLabelError
                                        : ErrorType::kTruePositive;
                        }
                        outcomes.push_back(outcome);
                }

                for (std::size_t g = 0; g < gt_indices.size(); ++g) {
                        const GroundTruthBox &gt = ground_truths[gt_indices[g]];
                        if (gt.is_crowd || assignment.ground_truth_consumed[g])
                                continue;
                        Outcome outcome;
                        outcome.type = ErrorType::kFalseNegative;
                        outcome.ground_truth = &gt;
                        outcome.sample_id = &gt.sample_id;
                        outcomes.push_back(outcome);
                }
        }
        return outcomes;
}

}  // namespace

const char *ErrorTypeKey(ErrorType type) {
        switch (type) {
                case ErrorType::kTruePositive:
                        return "tp";
                case ErrorType::kHardFalsePositive:
                        return "hard_fp";
                case ErrorType::kLabelError:
                        return "label_error";
                case ErrorType::kFalseNegative:
                        return "fn";
        }
        return "unknown";
}

ErrorAnalysis CategorizeErrors(const std::vector<GroundTruthBox> &ground_truths,
                               const std::vector<PredictionBox> &predictions,
                               const std::vector<std::string> &categories,
                               double iou_threshold, double conf_threshold,
                               std::size_t max_samples_per_type) {
        const std::vector<std::string> labels =
            SortedLabels(categories, ground_truths, predictions);

        ErrorAnalysis analysis;
        std::unordered_map<std::string, std::size_t> class_index;
        for (const auto &label : labels) {
                class_index.emplace(label, analysis.per_class.size());
                PerClassErrors errors;
                errors.class_name = label;
                analysis.per_class.push_back(errors);
        }

        std::size_t num_samples = 0;
        int64_t num_kept = 0;
        const std::vector<Outcome> outcomes =
            CollectOutcomes(ground_truths, predictions, iou_threshold,
                            conf_threshold, &num_samples, &num_kept);

        SampleCollector collector(max_samples_per_type);
        ErrorSummary &summary = analysis.summary;
        for (const Outcome &outcome : outcomes) {
                if (outcome.crowd) {
                        ++summary.crowd_matches;
                        continue;
                }
                const PredictionBox *dt = outcome.prediction;
                const GroundTruthBox *gt = outcome.ground_truth;
                switch (outcome.type) {
                        case ErrorType::kHardFalsePositive:
                                ++summary.hard_false_positives;
                                ++analysis.per_class[class_index.at(dt->category)]
                                      .hard_fp;
                                collector.add(*outcome.sample_id, outcome.type,
                                              dt->category, dt->confidence);
                                break;
                        case ErrorType::kLabelError:
                        case ErrorType::kTruePositive: {
                                PerClassErrors &errors =
                                    analysis.per_class[class_index.at(
                                        gt->category)];
                                if (outcome.type == ErrorType::kLabelError) {
                                        ++summary.label_errors;
                                        ++errors.label_error;
                                } else {
                                        ++summary.true_positives;
                                        ++errors.tp;
                                }
                                collector.add(*outcome.sample_id, outcome.type,
                                              dt->category, dt->confidence);
                                analysis.matched_pairs.push_back(
                                    MatchedPair{*outcome.sample_id,
                                                gt->category, dt->category});
                                break;
                        }
                        case ErrorType::kFalseNegative:
                                ++summary.false_negatives;
                                ++analysis.per_class[class_index.at(gt->category)]
                                      .fn;
                                collector.add(*outcome.sample_id, outcome.type,
                                              gt->category, std::nullopt);
                                break;
                }
        }

        assert(summary.true_positives + summary.label_errors +
                   summary.hard_false_positives + summary.crowd_matches ==
               num_kept);
        analysis.samples_by_type = collector.release();

        logger().debug(
            "error analysis over {} samples at iou={} conf={}: tp={} "
            "hard_fp={} label_error={} fn={} crowd={}",
            num_samples, iou_threshold, conf_threshold,
            summary.true_positives, summary.hard_false_positives,
            summary.label_errors, summary.false_negatives,
            summary.crowd_matches);
        return analysis;
}

std::vector<SampleScore> RankWorstSamples(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, double iou_threshold,
    double conf_threshold, std::size_t limit) {
        std::size_t num_samples = 0;
        int64_t num_kept = 0;
        const std::vector<Outcome> outcomes =
            CollectOutcomes(ground_truths, predictions, iou_threshold,
                            conf_threshold, &num_samples, &num_kept);

        // Outcomes arrive grouped by sample in sorted id order.
        std::vector<SampleScore> scores;
        std::vector<std::vector<double>> confidences;
        for (const Outcome &outcome : outcomes) {
                if (outcome.crowd || outcome.type == ErrorType::kTruePositive)
                        continue;
                if (scores.empty() ||
                    scores.back().sample_id != *outcome.sample_id) {
                        SampleScore entry;
                        entry.sample_id = *outcome.sample_id;
                        scores.push_back(entry);
                        confidences.emplace_back();
                }
                ++scores.back().error_count;
                if (outcome.prediction != nullptr)
                        confidences.back().push_back(
                            outcome.prediction->confidence);
        }
        if (scores.empty()) return scores;

        int64_t max_errors = 1;
        double max_spread = 0.0;
        for (std::size_t i = 0; i < scores.size(); ++i) {
                const std::vector<double> &values = confidences[i];
                if (values.size() >= 2) {
                        const double mean =
                            std::accumulate(values.begin(), values.end(), 0.0) /
                            values.size();
                        double sq = 0.0;
                        for (double v : values) sq += (v - mean) * (v - mean);
                        scores[i].confidence_spread =
                            std::sqrt(sq / values.size());
                }
                max_errors = std::max(max_errors, scores[i].error_count);
                max_spread = std::max(max_spread, scores[i].confidence_spread);
        }
        if (max_spread == 0.0) max_spread = 1.0;

        for (auto &entry : scores) {
                entry.score =
                    0.6 * static_cast<double>(entry.error_count) / max_errors +
                    0.4 * entry.confidence_spread / max_spread;
        }
        std::stable_sort(scores.begin(), scores.end(),
                         [](const SampleScore &a, const SampleScore &b) {
                                 return a.score > b.score;
                         });
        if (scores.size() > limit) scores.resize(limit);
        return scores;
}

const char *AnnotationLabelKey(AnnotationLabel label) {
        switch (label) {
                case AnnotationLabel::kTruePositive:
                        return "tp";
                case AnnotationLabel::kLabelError:
                        return "label_error";
                case AnnotationLabel::kFalsePositive:
                        return "fp";
                case AnnotationLabel::kFalseNegative:
                        return "fn";
                case AnnotationLabel::kCrowd:
                        return "crowd";
        }
        return "unknown";
}

std::vector<AnnotationMatch> MatchSampleAnnotations(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, const std::string &sample_id,
    double iou_threshold, double conf_threshold) {
        std::vector<uint64_t> gt_indices, dt_indices;
        for (uint64_t g = 0; g < ground_truths.size(); ++g) {
                if (ground_truths[g].sample_id == sample_id)
                        gt_indices.push_back(g);
        }
        for (uint64_t p : SortByConfidence(predictions)) {
                if (predictions[p].sample_id == sample_id &&
                    predictions[p].confidence >= conf_threshold)
                        dt_indices.push_back(p);
        }

        GreedyAssignment assignment;
        MatchSample(ground_truths, gt_indices, predictions, dt_indices,
                    iou_threshold, &assignment);

        std::vector<AnnotationMatch> matches;
        matches.reserve(dt_indices.size() + gt_indices.size());
        // Prediction row that consumed each ground truth, or -1.
        std::vector<int64_t> taken_by(gt_indices.size(), -1);
        for (std::size_t d = 0; d < dt_indices.size(); ++d) {
                AnnotationMatch match;
                match.annotation_id = predictions[dt_indices[d]].annotation_id;
                const int64_t g = assignment.detection_matches[d];
                if (g >= 0) {
                        match.matched_id =
                            ground_truths[gt_indices[g]].annotation_id;
                        match.iou = assignment.detection_ious[d];
                        if (assignment.detection_crowd[d]) {
                                match.label = AnnotationLabel::kCrowd;
                        } else {
                                match.label = assignment.detection_label_errors[d]
                                                  ? AnnotationLabel::kLabelError
                                                  : AnnotationLabel::kTruePositive;
                                taken_by[g] = static_cast<int64_t>(matches.size());
                        }
                }
                matches.push_back(std::move(match));
        }

        for (std::size_t g = 0; g < gt_indices.size(); ++g) {
                AnnotationMatch match;
                match.annotation_id = ground_truths[gt_indices[g]].annotation_id;
                match.is_ground_truth = true;
                if (ground_truths[gt_indices[g]].is_crowd) {
                        match.label = AnnotationLabel::kCrowd;
                } else if (taken_by[g] >= 0) {
                        const AnnotationMatch &by = matches[taken_by[g]];
                        match.label = by.label;
                        match.matched_id = by.annotation_id;
                        match.iou = by.iou;
                } else {
                        match.label = AnnotationLabel::kFalseNegative;
                }
                matches.push_back(std::move(match));
        }
        return matches;
}

ConfusionMatrix BuildDetectionConfusionMatrix(
    const std::vector<std::string> &labels,
    const std::vector<MatchedPair> &matched_pairs) {
        std::vector<std::pair<std::string, std::string>> pairs;
        pairs.reserve(matched_pairs.size());
        for (const auto &pair : matched_pairs) {
                pairs.emplace_back(pair.actual, pair.predicted);
        }
        return BuildConfusionMatrix(labels, pairs);
}

std::vector<std::string> CellSampleIds(
    const std::vector<MatchedPair> &matched_pairs, const std::string &actual,
    const std::string &predicted) {
        std::set<std::string> ids;
        for (const auto &pair : matched_pairs) {
                if (pair.actual == actual && pair.predicted == predicted)
                        ids.insert(pair.sample_id);
        }
        return std::vector<std::string>(ids.begin(), ids.end());
}

}  // namespace DetEval
}  // namespace detection_eval
