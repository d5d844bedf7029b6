// Copyright (c) MiXaiLL76
#include "confusion_matrix.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace detection_eval {
namespace DetEval {

int64_t ConfusionMatrix::row_sum(std::size_t row) const {
        int64_t sum = 0;
        for (int64_t v : matrix.at(row)) sum += v;
        return sum;
}

int64_t ConfusionMatrix::column_sum(std::size_t column) const {
        int64_t sum = 0;
        for (const auto &row : matrix) sum += row.at(column);
        return sum;
}

int64_t ConfusionMatrix::trace() const {
        int64_t sum = 0;
        for (std::size_t i = 0; i < matrix.size(); ++i) sum += matrix[i][i];
        return sum;
}

int64_t ConfusionMatrix::total() const {
        int64_t sum = 0;
        for (std::size_t i = 0; i < matrix.size(); ++i) sum += row_sum(i);
        return sum;
}

ConfusionMatrix BuildConfusionMatrix(
    const std::vector<std::string> &labels,
    const std::vector<std::pair<std::string, std::string>> &pairs) {
        std::unordered_map<std::string, std::size_t> label_to_index;
        label_to_index.reserve(labels.size());
        for (std::size_t i = 0; i < labels.size(); ++i) {
                label_to_index.emplace(labels[i], i);
        }

        ConfusionMatrix cm;
        cm.labels = labels;
        cm.matrix.assign(labels.size(),
                         std::vector<int64_t>(labels.size(), 0));

        for (const auto &pair : pairs) {
                auto actual = label_to_index.find(pair.first);
                auto predicted = label_to_index.find(pair.second);
                if (actual == label_to_index.end() ||
                    predicted == label_to_index.end()) {
                        throw std::invalid_argument(
                            "label pair (" + pair.first + ", " + pair.second +
                            ") is not covered by the confusion matrix labels");
                }
                ++cm.matrix[actual->second][predicted->second];
        }
        return cm;
}

ConfusionMatrix SelectLabels(const ConfusionMatrix &cm,
                             const std::vector<std::size_t> &indices) {
        ConfusionMatrix selected;
        selected.labels.reserve(indices.size());
        selected.matrix.reserve(indices.size());
        for (std::size_t ri : indices) {
                selected.labels.push_back(cm.labels.at(ri));
                std::vector<int64_t> row;
                row.reserve(indices.size());
                for (std::size_t ci : indices) {
                        row.push_back(cm.matrix.at(ri).at(ci));
                }
                selected.matrix.push_back(std::move(row));
        }
        return selected;
}

std::vector<std::string> SortedLabels(
    const std::vector<std::string> &categories,
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions) {
        std::set<std::string> labels(categories.begin(), categories.end());
        for (const auto &gt : ground_truths) labels.insert(gt.category);
        for (const auto &dt : predictions) labels.insert(dt.category);
        return std::vector<std::string>(labels.begin(), labels.end());
}

}  // namespace DetEval
}  // namespace detection_eval
