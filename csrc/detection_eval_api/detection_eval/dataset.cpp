// Copyright (c) MiXaiLL76
#include "dataset.h"

#include <cmath>
#include <utility>

#include "errors.h"
#include "logger.h"

namespace detection_eval {
namespace DetEval {

namespace {

// Reads a number stored as a JSON number or a numeric string.
bool ReadNumber(const json &value, double *out) {
        if (value.is_number()) {
                *out = value.get<double>();
                return true;
        }
        if (value.is_string()) {
                try {
                        std::size_t pos = 0;
                        const std::string text = value.get<std::string>();
                        *out = std::stod(text, &pos);
                        return pos == text.size();
                } catch (const std::exception &) {
                        return false;
                }
        }
        return false;
}

// Reads a flag stored as a bool or a number.
bool ReadFlag(const json &row, const char *key, const char *alias) {
        const char *name = row.contains(key) ? key : alias;
        if (!row.contains(name)) return false;
        const json &value = row[name];
        if (value.is_boolean()) return value.get<bool>();
        if (value.is_number()) return value.get<double>() != 0.0;
        if (value.is_null()) return false;
        throw ValidationError(std::string("annotation field '") + name +
                              "' must be a bool or a number");
}

std::string ReadId(const json &value, const char *name = "sample_id") {
        if (value.is_string()) return value.get<std::string>();
        if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
        throw ValidationError(std::string("annotation field '") + name +
                              "' must be a string");
}

BoundingBox ReadBox(const json &row, bool required) {
        BoundingBox box;
        double v[4] = {0., 0., 0., 0.};
        if (row.contains("bbox") && !row["bbox"].is_null()) {
                const json &bbox = row["bbox"];
                if (!bbox.is_array() || bbox.size() != 4)
                        throw ValidationError(
                            "annotation field 'bbox' must be [x, y, w, h]");
                for (std::size_t k = 0; k < 4; ++k) {
                        if (!ReadNumber(bbox[k], &v[k]))
                                throw ValidationError(
                                    "annotation field 'bbox' must hold "
                                    "numbers");
                }
        } else if (row.contains("bbox_x")) {
                const char *keys[4] = {"bbox_x", "bbox_y", "bbox_w", "bbox_h"};
                for (std::size_t k = 0; k < 4; ++k) {
                        if (!row.contains(keys[k]) ||
                            !ReadNumber(row[keys[k]], &v[k]))
                                throw ValidationError(
                                    std::string("annotation field '") +
                                    keys[k] + "' must be a number");
                }
        } else if (required) {
                throw ValidationError("detection annotation without a bbox");
        }
        for (double value : v) {
                if (!std::isfinite(value))
                        throw ValidationError(
                            "annotation bbox values must be finite");
        }
        box.x = v[0];
        box.y = v[1];
        box.w = v[2];
        box.h = v[3];
        return box;
}

double ReadConfidence(const json &row) {
        const char *name = row.contains("confidence") ? "confidence" : "score";
        if (!row.contains(name) || row[name].is_null()) return 1.0;
        double confidence = 0.0;
        if (!ReadNumber(row[name], &confidence) || std::isnan(confidence)) {
                throw ValidationError(std::string("annotation field '") +
                                      name + "' must be a number");
        }
        if (confidence < 0.0 || confidence > 1.0) {
                throw ValidationError(std::string("annotation field '") +
                                      name + "' must be within [0, 1], got " +
                                      std::to_string(confidence));
        }
        return confidence;
}

}  // namespace

const char *DatasetTypeName(DatasetType type) {
        switch (type) {
                case DatasetType::kDetection:
                        return "detection";
                case DatasetType::kClassification:
                        return "classification";
        }
        return "unknown";
}

DatasetType ParseDatasetType(const std::string &name) {
        if (name == "detection") return DatasetType::kDetection;
        if (name == "classification") return DatasetType::kClassification;
        throw ValidationError("unknown dataset type '" + name + "'");
}

Dataset::Dataset(std::string dataset_id, DatasetType dataset_type)
    : dataset_id_(std::move(dataset_id)), dataset_type_(dataset_type) {
        if (dataset_id_.empty())
                throw ValidationError("dataset_id must not be empty");
}

void Dataset::append(const json &row) {
        if (!row.is_object())
                throw ValidationError("annotation row must be a JSON object");
        if (!row.contains("sample_id"))
                throw ValidationError("annotation row without 'sample_id'");
        const std::string sample_id = ReadId(row["sample_id"]);

        const char *category_key =
            row.contains("category_name") ? "category_name" : "category";
        if (!row.contains(category_key) || !row[category_key].is_string())
                throw ValidationError("annotation row without a category name");
        const std::string category = row[category_key].get<std::string>();

        std::string source = kGroundTruthSource;
        if (row.contains("source") && !row["source"].is_null()) {
                if (!row["source"].is_string() ||
                    row["source"].get<std::string>().empty())
                        throw ValidationError(
                            "annotation field 'source' must be a non-empty "
                            "string");
                source = row["source"].get<std::string>();
        }

        const BoundingBox bbox =
            ReadBox(row, dataset_type_ == DatasetType::kDetection);
        const bool is_ground_truth = source == kGroundTruthSource;
        const bool is_crowd =
            is_ground_truth && ReadFlag(row, "is_crowd", "iscrowd");
        const double confidence = is_ground_truth ? 1.0 : ReadConfidence(row);

        const char *id_key = row.contains("id") ? "id" : "annotation_id";
        std::string annotation_id;
        if (row.contains(id_key) && !row[id_key].is_null()) {
                annotation_id = ReadId(row[id_key], id_key);
                if (annotation_id.empty() || annotation_ids_.count(annotation_id))
                        throw ValidationError("duplicate or empty annotation id '" +
                                              annotation_id + "'");
        } else {
                annotation_id = next_annotation_id(source);
        }

        note_sample(sample_id);
        if (row.contains("split") && row["split"].is_string())
                set_split(sample_id, row["split"].get<std::string>());
        if (categories_.insert(category).second && !is_ground_truth)
                logger().warn("dataset {}: category '{}' first seen in "
                              "predictions of '{}'",
                              dataset_id_, category, source);

        if (is_ground_truth) {
                ground_truths_.emplace_back(sample_id, category, bbox, is_crowd);
                ground_truths_.back().annotation_id = annotation_id;
        } else {
                auto &rows = predictions_[source];
                rows.emplace_back(sample_id, category, bbox, confidence, source);
                rows.back().annotation_id = annotation_id;
        }
        annotation_ids_.insert(std::move(annotation_id));
}

std::string Dataset::next_annotation_id(const std::string &source) const {
        std::size_t n = size();
        std::string id;
        do {
                id = source + "/" + std::to_string(n++);
        } while (annotation_ids_.count(id));
        return id;
}

void Dataset::add_category(const std::string &category) {
        categories_.insert(category);
}

void Dataset::set_split(const std::string &sample_id, const std::string &split) {
        samples_[sample_id] = split;
}

void Dataset::note_sample(const std::string &sample_id) {
        samples_.emplace(sample_id, std::string());
}

void Dataset::clean() {
        categories_.clear();
        samples_.clear();
        ground_truths_.clear();
        ground_truths_.shrink_to_fit();
        predictions_.clear();
        annotation_ids_.clear();
}

std::size_t Dataset::size() const {
        std::size_t rows = ground_truths_.size();
        for (const auto &kv : predictions_) rows += kv.second.size();
        return rows;
}

bool Dataset::in_split(const std::string &sample_id,
                       const std::optional<std::string> &split) const {
        if (!split) return true;
        auto it = samples_.find(sample_id);
        return it != samples_.end() && it->second == *split;
}

std::vector<GroundTruthBox> Dataset::ground_truths(
    const std::optional<std::string> &split) const {
        if (!split) return ground_truths_;
        std::vector<GroundTruthBox> result;
        for (const auto &gt : ground_truths_) {
                if (in_split(gt.sample_id, split)) result.push_back(gt);
        }
        return result;
}

std::vector<PredictionBox> Dataset::predictions(
    const std::string &source, const std::optional<std::string> &split) const {
        auto it = predictions_.find(source);
        if (it == predictions_.end()) return {};
        if (!split) return it->second;
        std::vector<PredictionBox> result;
        for (const auto &dt : it->second) {
                if (in_split(dt.sample_id, split)) result.push_back(dt);
        }
        return result;
}

std::vector<std::string> Dataset::categories() const {
        return std::vector<std::string>(categories_.begin(), categories_.end());
}

std::vector<std::string> Dataset::sources() const {
        std::vector<std::string> result;
        for (const auto &kv : predictions_) {
                if (!kv.second.empty()) result.push_back(kv.first);
        }
        return result;
}

json Dataset::to_json() const {
        json samples = json::array();
        for (const auto &kv : samples_) {
                json sample = {{"id", kv.first}};
                sample["split"] = kv.second.empty() ? json(nullptr)
                                                    : json(kv.second);
                samples.push_back(std::move(sample));
        }

        json annotations = json::array();
        for (const auto &gt : ground_truths_) {
                annotations.push_back(
                    {{"id", gt.annotation_id},
                     {"sample_id", gt.sample_id},
                     {"category_name", gt.category},
                     {"bbox", {gt.bbox.x, gt.bbox.y, gt.bbox.w, gt.bbox.h}},
                     {"source", kGroundTruthSource},
                     {"is_crowd", gt.is_crowd}});
        }
        for (const auto &kv : predictions_) {
                for (const auto &dt : kv.second) {
                        annotations.push_back(
                            {{"id", dt.annotation_id},
                             {"sample_id", dt.sample_id},
                             {"category_name", dt.category},
                             {"bbox",
                              {dt.bbox.x, dt.bbox.y, dt.bbox.w, dt.bbox.h}},
                             {"source", dt.source},
                             {"confidence", dt.confidence}});
                }
        }

        return json{{"dataset_id", dataset_id_},
                    {"dataset_type", DatasetTypeName(dataset_type_)},
                    {"categories", categories()},
                    {"samples", std::move(samples)},
                    {"annotations", std::move(annotations)}};
}

Dataset Dataset::from_json(const json &document) {
        if (!document.is_object())
                throw ValidationError("dataset document must be a JSON object");
        if (!document.contains("dataset_id") ||
            !document["dataset_id"].is_string())
                throw ValidationError("dataset document without 'dataset_id'");

        DatasetType type = DatasetType::kDetection;
        if (document.contains("dataset_type")) {
                if (!document["dataset_type"].is_string())
                        throw ValidationError(
                            "'dataset_type' must be a string");
                type = ParseDatasetType(
                    document["dataset_type"].get<std::string>());
        }

        Dataset dataset(document["dataset_id"].get<std::string>(), type);
        if (document.contains("categories")) {
                for (const auto &category : document["categories"]) {
                        if (!category.is_string())
                                throw ValidationError(
                                    "'categories' must hold strings");
                        dataset.add_category(category.get<std::string>());
                }
        }
        if (document.contains("samples")) {
                for (const auto &sample : document["samples"]) {
                        if (!sample.is_object() || !sample.contains("id"))
                                throw ValidationError(
                                    "'samples' entries need an 'id'");
                        const std::string id = ReadId(sample["id"]);
                        dataset.note_sample(id);
                        if (sample.contains("split") &&
                            sample["split"].is_string())
                                dataset.set_split(
                                    id, sample["split"].get<std::string>());
                }
        }
        if (document.contains("annotations")) {
                for (const auto &row : document["annotations"]) {
                        dataset.append(row);
                }
        }

        logger().debug("loaded dataset {} ({}): {} rows, {} categories",
                       dataset.dataset_id_, DatasetTypeName(type),
                       dataset.size(), dataset.categories_.size());
        return dataset;
}

}  // namespace DetEval
}  // namespace detection_eval
