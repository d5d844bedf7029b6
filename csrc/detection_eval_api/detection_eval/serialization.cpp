// Copyright (c) MiXaiLL76
#include "serialization.h"

#include <string>
#include <utility>

#include "errors.h"

namespace detection_eval {
namespace DetEval {

namespace {

void MatrixFromJson(const json &j, ConfusionMatrix *cm) {
        cm->labels = j.at("confusion_matrix_labels")
                         .get<std::vector<std::string>>();
        cm->matrix = j.at("confusion_matrix")
                         .get<std::vector<std::vector<int64_t>>>();
        if (cm->matrix.size() != cm->labels.size())
                throw ValidationError(
                    "confusion_matrix must have one row per label");
        for (const auto &row : cm->matrix) {
                if (row.size() != cm->labels.size())
                        throw ValidationError("confusion_matrix must be square");
        }
}

void CheckEvaluationType(const json &j, const char *expected) {
        if (!j.contains("evaluation_type")) return;
        const json &type = j["evaluation_type"];
        if (!type.is_string() || type.get<std::string>() != expected) {
                throw ValidationError(std::string("expected a ") + expected +
                                      " evaluation");
        }
}

std::string ReadString(const json &j, const char *key) {
        if (!j.contains(key) || !j[key].is_string())
                throw ValidationError(std::string("request field '") + key +
                                      "' must be a string");
        return j[key].get<std::string>();
}

}  // namespace

void to_json(json &j, const DetectionEvaluation &evaluation) {
        j = json{{"evaluation_type", "detection"},
                 {"pr_curves", evaluation.pr_curves},
                 {"ap_metrics", evaluation.ap_metrics},
                 {"per_class_metrics", evaluation.per_class_metrics},
                 {"confusion_matrix", evaluation.confusion_matrix.matrix},
                 {"confusion_matrix_labels", evaluation.confusion_matrix.labels},
                 {"iou_threshold", evaluation.iou_threshold},
                 {"conf_threshold", evaluation.conf_threshold}};
}

void from_json(const json &j, DetectionEvaluation &evaluation) {
        CheckEvaluationType(j, "detection");
        j.at("pr_curves").get_to(evaluation.pr_curves);
        j.at("ap_metrics").get_to(evaluation.ap_metrics);
        j.at("per_class_metrics").get_to(evaluation.per_class_metrics);
        MatrixFromJson(j, &evaluation.confusion_matrix);
        j.at("iou_threshold").get_to(evaluation.iou_threshold);
        j.at("conf_threshold").get_to(evaluation.conf_threshold);
}

void to_json(json &j, const ClassificationEvaluation &evaluation) {
        j = json{{"evaluation_type", "classification"},
                 {"accuracy", evaluation.accuracy},
                 {"macro_f1", evaluation.macro_f1},
                 {"weighted_f1", evaluation.weighted_f1},
                 {"per_class_metrics", evaluation.per_class_metrics},
                 {"confusion_matrix", evaluation.confusion_matrix.matrix},
                 {"confusion_matrix_labels", evaluation.confusion_matrix.labels},
                 {"conf_threshold", evaluation.conf_threshold}};
}

void from_json(const json &j, ClassificationEvaluation &evaluation) {
        CheckEvaluationType(j, "classification");
        j.at("accuracy").get_to(evaluation.accuracy);
        j.at("macro_f1").get_to(evaluation.macro_f1);
        j.at("weighted_f1").get_to(evaluation.weighted_f1);
        j.at("per_class_metrics").get_to(evaluation.per_class_metrics);
        MatrixFromJson(j, &evaluation.confusion_matrix);
        j.at("conf_threshold").get_to(evaluation.conf_threshold);
}

void to_json(json &j, const ErrorSample &sample) {
        j = json{{"sample_id", sample.sample_id},
                 {"error_type", ErrorTypeKey(sample.error_type)},
                 {"category_name", sample.category_name},
                 {"confidence", sample.confidence ? json(*sample.confidence)
                                                  : json(nullptr)}};
}

void to_json(json &j, const ErrorAnalysis &analysis) {
        j = json{{"summary", analysis.summary},
                 {"per_class", analysis.per_class},
                 {"samples_by_type", analysis.samples_by_type},
                 {"matched_pairs", analysis.matched_pairs}};
}

void to_json(json &j, const AnnotationMatch &match) {
        j = json{{"annotation_id", match.annotation_id},
                 {"is_ground_truth", match.is_ground_truth},
                 {"label", AnnotationLabelKey(match.label)},
                 {"matched_id",
                  match.matched_id ? json(*match.matched_id) : json(nullptr)},
                 {"iou", match.iou ? json(*match.iou) : json(nullptr)}};
}

json ResultToJson(const EvaluationResult &result) {
        return std::visit([](const auto &evaluation) { return json(evaluation); },
                          result);
}

EvaluationRequest RequestFromJson(const json &j) {
        if (!j.is_object())
                throw ValidationError("request must be a JSON object");
        EvaluationRequest request;
        request.dataset_id = ReadString(j, "dataset_id");
        request.source = ReadString(j, "source");
        if (j.contains("dataset_type") && !j["dataset_type"].is_null())
                request.dataset_type =
                    ParseDatasetType(ReadString(j, "dataset_type"));
        if (j.contains("split") && !j["split"].is_null())
                request.split = ReadString(j, "split");
        request.params = Params::FromJson(j);
        return request;
}

}  // namespace DetEval
}  // namespace detection_eval
