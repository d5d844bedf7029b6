// Copyright (c) MiXaiLL76
#pragma once

#include <memory>
#include <set>
#include <string>
#include <unordered_map>

#include "detection_evaluator.h"

namespace detection_eval {
namespace DetEval {

// Canonical key of an exclusion set: sorted names joined with '\0'.
std::string ExclusionKey(const std::set<std::string> &excluded);

// Removes the excluded classes from per-class metrics, PR curves and both
// confusion matrix axes, then recomputes mAP and the "all" curve from what
// remains. An empty set returns a copy of the evaluation.
DetectionEvaluation FilterEvaluation(const DetectionEvaluation &evaluation,
                                     const std::set<std::string> &excluded);

// Memoized FilterEvaluation for one source evaluation. Entries are only
// dropped together, when the source is replaced.
class FilteredEvaluationCache {
       public:
        explicit FilteredEvaluationCache(
            std::shared_ptr<const DetectionEvaluation> source);

        // Filtered view of the source; computed on first request per key.
        const DetectionEvaluation &Get(const std::set<std::string> &excluded);

        // Binds the cache to a new source and clears every entry.
        void Reset(std::shared_ptr<const DetectionEvaluation> source);

        std::size_t size() const { return cache_.size(); }
        const std::shared_ptr<const DetectionEvaluation> &source() const {
                return source_;
        }

       private:
        std::shared_ptr<const DetectionEvaluation> source_;
        std::unordered_map<std::string, DetectionEvaluation> cache_;
};

}  // namespace DetEval
}  // namespace detection_eval
