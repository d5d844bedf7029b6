// Copyright (c) MiXaiLL76
#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

namespace detection_eval {
namespace DetEval {

using json = nlohmann::json;

// Evaluation parameters. Defaults follow the COCO detection protocol.
struct Params {
        Params();

        // IoU thresholds averaged into ap50_95 (0.50:0.05:0.95)
        std::vector<double> iou_thresholds;
        // Recall grid used for interpolated AP (0:0.01:1)
        std::vector<double> recall_thresholds;
        // Operating point for PR curves, error analysis and confusion matrix
        double iou_threshold = 0.5;
        double conf_threshold = 0.25;
        // Exemplars kept per error type
        std::size_t max_samples_per_type = 50;
        // Points kept per returned PR curve
        std::size_t max_curve_points = 200;

        // Throws ValidationError when a threshold is outside [0, 1] or NaN,
        // or when a list is empty.
        void Validate() const;

        // Reads the keys present in a JSON config, keeping defaults for the
        // rest. Accepted keys: iou_thresholds, iou_threshold, conf_threshold,
        // max_samples_per_type, max_curve_points, recall_points.
        static Params FromJson(const json &config);
        json ToJson() const;
};

// Same values as numpy.linspace(start, stop, num).
std::vector<double> Linspace(double start, double stop, std::size_t num);

}  // namespace DetEval
}  // namespace detection_eval
