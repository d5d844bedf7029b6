// Copyright (c) MiXaiLL76
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace detection_eval {
namespace DetEval {

// Square count matrix, matrix[actual][predicted], rows and columns in the
// order of labels.
struct ConfusionMatrix {
        std::vector<std::string> labels;
        std::vector<std::vector<int64_t>> matrix;

        int64_t row_sum(std::size_t row) const;
        int64_t column_sum(std::size_t column) const;
        int64_t trace() const;
        int64_t total() const;
};

// Builds the matrix from (actual, predicted) label pairs. Every label of a
// pair must be present in labels.
ConfusionMatrix BuildConfusionMatrix(
    const std::vector<std::string> &labels,
    const std::vector<std::pair<std::string, std::string>> &pairs);

// Keeps only the given row/column indices, in the given order.
ConfusionMatrix SelectLabels(const ConfusionMatrix &cm,
                             const std::vector<std::size_t> &indices);

// Sorted, de-duplicated union of the dataset categories and every category
// seen in the rows, so classes without instances stay reportable.
std::vector<std::string> SortedLabels(
    const std::vector<std::string> &categories,
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions);

}  // namespace DetEval
}  // namespace detection_eval
