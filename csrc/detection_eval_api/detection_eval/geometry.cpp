// Copyright (c) MiXaiLL76
#include "geometry.h"

#include <algorithm>
#include <stdexcept>

namespace detection_eval {
namespace DetEval {

// Extents are taken from the corner coordinates so that the area of a box
// and its intersection with itself round identically.
double BoxArea(const BoundingBox &box) {
        if (box.w <= 0.0 || box.h <= 0.0) return 0.0;
        return ((box.x + box.w) - box.x) * ((box.y + box.h) - box.y);
}

double ComputeIoU(const BoundingBox &dt, const BoundingBox &gt,
                  bool gt_is_crowd) {
        const double da = BoxArea(dt);
        const double ga = BoxArea(gt);
        if (da <= 0.0 || ga <= 0.0) return 0.0;

        // compute intersection
        const double intersect_w =
            std::min(dt.x + dt.w, gt.x + gt.w) - std::max(dt.x, gt.x);
        if (intersect_w <= 0.0) return 0.0;
        const double intersect_h =
            std::min(dt.y + dt.h, gt.y + gt.h) - std::max(dt.y, gt.y);
        if (intersect_h <= 0.0) return 0.0;

        const double inter = intersect_w * intersect_h;
        const double uni = gt_is_crowd ? da : da + ga - inter;
        if (uni <= 0.0) return 0.0;
        return std::min(inter / uni, 1.0);
}

std::vector<double> ComputeIoUMatrix(const std::vector<BoundingBox> &dt,
                                     const std::vector<BoundingBox> &gt,
                                     const std::vector<bool> &iscrowd) {
        const std::size_t m = dt.size();
        const std::size_t n = gt.size();
        if (!iscrowd.empty() && iscrowd.size() != n)
                throw std::invalid_argument(
                    "iscrowd size must be 0 or equal to n.");

        const bool useCrowd = !iscrowd.empty();
        std::vector<double> o(m * n, 0.0);
        for (std::size_t d = 0; d < m; ++d) {
                for (std::size_t g = 0; g < n; ++g) {
                        o[d * n + g] =
                            ComputeIoU(dt[d], gt[g], useCrowd && iscrowd[g]);
                }
        }
        return o;
}

}  // namespace DetEval
}  // namespace detection_eval
