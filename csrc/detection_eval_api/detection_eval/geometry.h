// Copyright (c) MiXaiLL76
#pragma once

#include <cstddef>
#include <vector>

#include "types.h"

namespace detection_eval {
namespace DetEval {

// Area of a box; boxes with non-positive width or height have area 0.
double BoxArea(const BoundingBox &box);

// Intersection over union of a predicted box and a ground-truth box.
// When gt_is_crowd is set the prediction area is used as the union (crowd
// IoU). Degenerate boxes give 0.
double ComputeIoU(const BoundingBox &dt, const BoundingBox &gt,
                  bool gt_is_crowd = false);

// Computes IoU between every predicted and ground-truth box.
// Parameters:
//   - dt: m predicted boxes
//   - gt: n ground-truth boxes
//   - iscrowd: empty, or n flags selecting crowd IoU per ground truth
// Returns:
//   - m*n IoU values in row-major order: o[d*n + g]
std::vector<double> ComputeIoUMatrix(const std::vector<BoundingBox> &dt,
                                     const std::vector<BoundingBox> &gt,
                                     const std::vector<bool> &iscrowd);

}  // namespace DetEval
}  // namespace detection_eval
