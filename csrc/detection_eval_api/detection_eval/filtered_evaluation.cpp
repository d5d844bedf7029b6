// Copyright (c) MiXaiLL76
#include "filtered_evaluation.h"

#include <stdexcept>
#include <utility>

#include "logger.h"

namespace detection_eval {
namespace DetEval {

std::string ExclusionKey(const std::set<std::string> &excluded) {
        std::string key;
        bool first = true;
        for (const auto &name : excluded) {
                if (!first) key.push_back('\0');
                key += name;
                first = false;
        }
        return key;
}

DetectionEvaluation FilterEvaluation(const DetectionEvaluation &evaluation,
                                     const std::set<std::string> &excluded) {
        if (excluded.empty()) return evaluation;

        DetectionEvaluation filtered;
        filtered.iou_threshold = evaluation.iou_threshold;
        filtered.conf_threshold = evaluation.conf_threshold;

        for (const auto &m : evaluation.per_class_metrics) {
                if (excluded.count(m.class_name) == 0)
                        filtered.per_class_metrics.push_back(m);
        }

        // Per-class curves only; "all" is rebuilt from the remaining ones.
        std::vector<PRCurve> class_curves;
        for (const auto &curve : evaluation.pr_curves) {
                if (curve.class_name == kAllCurveName) continue;
                if (excluded.count(curve.class_name) == 0)
                        class_curves.push_back(curve);
        }

        std::vector<std::size_t> kept;
        const auto &labels = evaluation.confusion_matrix.labels;
        for (std::size_t i = 0; i < labels.size(); ++i) {
                if (excluded.count(labels[i]) == 0) kept.push_back(i);
        }
        filtered.confusion_matrix =
            SelectLabels(evaluation.confusion_matrix, kept);

        filtered.ap_metrics = ComputeMapMetrics(filtered.per_class_metrics);
        filtered.pr_curves.reserve(class_curves.size() + 1);
        filtered.pr_curves.push_back(SynthesizeAllCurve(class_curves));
        for (auto &curve : class_curves)
                filtered.pr_curves.push_back(std::move(curve));
        return filtered;
}

FilteredEvaluationCache::FilteredEvaluationCache(
    std::shared_ptr<const DetectionEvaluation> source)
    : source_(std::move(source)) {
        if (!source_) {
                throw std::invalid_argument(
                    "FilteredEvaluationCache requires a source evaluation");
        }
}

const DetectionEvaluation &FilteredEvaluationCache::Get(
    const std::set<std::string> &excluded) {
        std::string key = ExclusionKey(excluded);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;

        logger().debug("filtering evaluation, {} classes excluded",
                       excluded.size());
        return cache_.emplace(std::move(key), FilterEvaluation(*source_, excluded))
            .first->second;
}

void FilteredEvaluationCache::Reset(
    std::shared_ptr<const DetectionEvaluation> source) {
        if (!source) {
                throw std::invalid_argument(
                    "FilteredEvaluationCache requires a source evaluation");
        }
        source_ = std::move(source);
        cache_.clear();
}

}  // namespace DetEval
}  // namespace detection_eval
