// Copyright (c) MiXaiLL76
#pragma once

#include <string>

#include "detection_eval/types.h"

namespace detection_eval {
namespace DetEval {
namespace testing {

inline BoundingBox Box(double x, double y, double w, double h) {
        BoundingBox box;
        box.x = x;
        box.y = y;
        box.w = w;
        box.h = h;
        return box;
}

inline GroundTruthBox Gt(const std::string &sample_id,
                         const std::string &category, BoundingBox bbox,
                         bool is_crowd = false) {
        return GroundTruthBox(sample_id, category, bbox, is_crowd);
}

inline PredictionBox Pred(const std::string &sample_id,
                          const std::string &category, BoundingBox bbox,
                          double confidence) {
        return PredictionBox(sample_id, category, bbox, confidence, "model");
}

}  // namespace testing
}  // namespace DetEval
}  // namespace detection_eval
