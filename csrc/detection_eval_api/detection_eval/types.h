// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace detection_eval {
namespace DetEval {

// Source label of ground-truth rows; every other source is a prediction run.
constexpr const char *kGroundTruthSource = "ground_truth";

// Axis-aligned box in pixel coordinates, top-left origin.
struct BoundingBox {
        double x = 0.;
        double y = 0.;
        double w = 0.;
        double h = 0.;
};

// Annotation data for a single ground-truth object in a sample
struct GroundTruthBox {
        GroundTruthBox() = default;
        GroundTruthBox(std::string sample_id, std::string category,
                       BoundingBox bbox, bool is_crowd = false)
            : sample_id(std::move(sample_id)),
              category(std::move(category)),
              bbox(bbox),
              is_crowd(is_crowd) {}

        std::string sample_id;
        std::string category;
        BoundingBox bbox;
        bool is_crowd = false;  // crowd region
        std::string annotation_id;
};

// Annotation data for a single predicted object in a sample
struct PredictionBox {
        PredictionBox() = default;
        PredictionBox(std::string sample_id, std::string category,
                      BoundingBox bbox, double confidence,
                      std::string source = "")
            : sample_id(std::move(sample_id)),
              category(std::move(category)),
              bbox(bbox),
              confidence(confidence),
              source(std::move(source)) {}

        std::string sample_id;
        std::string category;
        BoundingBox bbox;
        double confidence = 1.;  // confidence score
        std::string source;      // prediction run
        std::string annotation_id;
};

// Result of assigning one prediction. Indices refer to the vectors handed to
// the matcher; ground_truth is empty when the prediction stayed unmatched.
struct Match {
        Match(uint64_t prediction, std::optional<uint64_t> ground_truth,
              double iou, bool crowd = false)
            : prediction(prediction),
              ground_truth(ground_truth),
              iou(iou),
              crowd(crowd) {}

        uint64_t prediction;
        std::optional<uint64_t> ground_truth;
        double iou;
        bool crowd;  // absorbed by a crowd region, ground truth not consumed
};

template <class T>
inline void hash_combine(std::size_t &seed, const T &v) {
        std::hash<T> hasher;
        seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

struct hash_pair {
        std::size_t operator()(
            const std::pair<std::string, std::string> &p) const {
                std::size_t h = 0;
                hash_combine(h, p.first);
                hash_combine(h, p.second);
                return h;
        }
};

// Ratio with a zero denominator defined as 0.
inline double SafeDivide(double numerator, double denominator) {
        return denominator > 0 ? numerator / denominator : 0.0;
}

}  // namespace DetEval
}  // namespace detection_eval
