// Copyright (c) MiXaiLL76
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.h"

namespace detection_eval {
namespace DetEval {

using json = nlohmann::json;

enum class DatasetType { kDetection, kClassification };

// "detection" / "classification"
const char *DatasetTypeName(DatasetType type);
// Throws ValidationError for any other name.
DatasetType ParseDatasetType(const std::string &name);

// In-memory annotation store of one dataset: ground truth and every
// prediction source share one row schema, distinguished by "source".
class Dataset {
       public:
        Dataset(std::string dataset_id, DatasetType dataset_type);

        // Appends one annotation row. Accepted fields:
        //   sample_id (string or integer), category_name or category,
        //   bbox [x, y, w, h] or bbox_x/bbox_y/bbox_w/bbox_h,
        //   confidence or score (number, numeric string or null -> 1.0),
        //   source (default "ground_truth"), is_crowd or iscrowd, split,
        //   id or annotation_id (generated as "<source>/<n>" when absent).
        // Classification rows may omit the box. Confidence must lie in
        // [0, 1] and annotation ids must be unique.
        // Throws ValidationError on a malformed row.
        void append(const json &row);

        void add_category(const std::string &category);
        void set_split(const std::string &sample_id, const std::string &split);

        // Remove all stored annotations, samples and categories.
        void clean();

        // Number of stored annotation rows.
        std::size_t size() const;

        // True when any row or split assignment names the sample.
        bool has_sample(const std::string &sample_id) const {
                return samples_.count(sample_id) > 0;
        }

        const std::string &dataset_id() const { return dataset_id_; }
        DatasetType dataset_type() const { return dataset_type_; }

        // Ground truths, optionally restricted to the samples of one split.
        std::vector<GroundTruthBox> ground_truths(
            const std::optional<std::string> &split = std::nullopt) const;

        // Predictions of one source, optionally restricted to one split.
        std::vector<PredictionBox> predictions(
            const std::string &source,
            const std::optional<std::string> &split = std::nullopt) const;

        // Declared and observed categories, sorted.
        std::vector<std::string> categories() const;

        // Prediction sources with at least one row, sorted.
        std::vector<std::string> sources() const;

        // Document form:
        //   {dataset_id, dataset_type, categories, samples: [{id, split}],
        //    annotations: [rows]}
        json to_json() const;
        static Dataset from_json(const json &document);

       private:
        bool in_split(const std::string &sample_id,
                      const std::optional<std::string> &split) const;
        void note_sample(const std::string &sample_id);
        std::string next_annotation_id(const std::string &source) const;

        std::string dataset_id_;
        DatasetType dataset_type_;
        std::set<std::string> categories_;
        // sample id -> split, empty when unknown
        std::map<std::string, std::string> samples_;
        std::vector<GroundTruthBox> ground_truths_;
        std::map<std::string, std::vector<PredictionBox>> predictions_;
        std::set<std::string> annotation_ids_;
};

}  // namespace DetEval
}  // namespace detection_eval
