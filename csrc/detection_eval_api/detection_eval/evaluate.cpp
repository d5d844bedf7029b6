// Copyright (c) MiXaiLL76
#include "evaluate.h"

#include <algorithm>
#include <string>

#include "errors.h"
#include "logger.h"

namespace detection_eval {
namespace DetEval {

void ValidateRequest(const Dataset &dataset, const EvaluationRequest &request) {
        if (request.dataset_id.empty())
                throw ValidationError("dataset_id must not be empty");
        if (request.dataset_id != dataset.dataset_id())
                throw ValidationError("unknown dataset '" + request.dataset_id +
                                      "'");
        if (request.dataset_type &&
            *request.dataset_type != dataset.dataset_type()) {
                throw ValidationError(
                    "dataset '" + request.dataset_id + "' is a " +
                    DatasetTypeName(dataset.dataset_type()) +
                    " dataset, not " + DatasetTypeName(*request.dataset_type));
        }
        if (request.source.empty())
                throw ValidationError("source must not be empty");
        if (request.source == kGroundTruthSource)
                throw ValidationError("source must name a prediction run");
        const std::vector<std::string> sources = dataset.sources();
        if (std::find(sources.begin(), sources.end(), request.source) ==
            sources.end())
                throw ValidationError("unknown source '" + request.source +
                                      "' in dataset '" + request.dataset_id +
                                      "'");
        if (dataset.predictions(request.source, request.split).empty())
                throw ValidationError("source '" + request.source +
                                      "' has no predictions in split '" +
                                      request.split.value_or("") + "'");
        request.params.Validate();
}

DetectionEvaluation EvaluateDetectionRows(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions,
    const std::vector<std::string> &categories, const Params &params) {
        DetectionMetrics metrics =
            EvaluateDetection(ground_truths, predictions, categories, params);
        const ErrorAnalysis errors = CategorizeErrors(
            ground_truths, predictions, categories, params.iou_threshold,
            params.conf_threshold, params.max_samples_per_type);

        DetectionEvaluation evaluation;
        evaluation.pr_curves = std::move(metrics.pr_curves);
        evaluation.ap_metrics = metrics.ap_metrics;
        evaluation.per_class_metrics = std::move(metrics.per_class_metrics);
        evaluation.confusion_matrix = BuildDetectionConfusionMatrix(
            SortedLabels(categories, ground_truths, predictions),
            errors.matched_pairs);
        evaluation.iou_threshold = params.iou_threshold;
        evaluation.conf_threshold = params.conf_threshold;
        return evaluation;
}

EvaluationResult Evaluate(const Dataset &dataset,
                          const EvaluationRequest &request) {
        ValidateRequest(dataset, request);
        const auto ground_truths = dataset.ground_truths(request.split);
        const auto predictions =
            dataset.predictions(request.source, request.split);
        logger().info("evaluating {} source '{}' on dataset '{}'",
                      DatasetTypeName(dataset.dataset_type()), request.source,
                      request.dataset_id);

        if (dataset.dataset_type() == DatasetType::kClassification) {
                return EvaluateClassification(
                    PairClassificationLabels(ground_truths, predictions,
                                             request.params.conf_threshold),
                    dataset.categories(), request.params.conf_threshold);
        }
        return EvaluateDetectionRows(ground_truths, predictions,
                                     dataset.categories(), request.params);
}

ErrorAnalysis AnalyzeErrors(const Dataset &dataset,
                            const EvaluationRequest &request) {
        ValidateRequest(dataset, request);
        const auto ground_truths = dataset.ground_truths(request.split);
        const auto predictions =
            dataset.predictions(request.source, request.split);
        const Params &params = request.params;

        if (dataset.dataset_type() == DatasetType::kClassification) {
                return CategorizeClassificationErrors(
                    PairClassificationLabels(ground_truths, predictions,
                                             params.conf_threshold),
                    dataset.categories(), params.max_samples_per_type);
        }
        return CategorizeErrors(ground_truths, predictions,
                                dataset.categories(), params.iou_threshold,
                                params.conf_threshold,
                                params.max_samples_per_type);
}

std::vector<std::string> ConfusionCellSamples(const Dataset &dataset,
                                              const EvaluationRequest &request,
                                              const std::string &actual,
                                              const std::string &predicted) {
        const ErrorAnalysis errors = AnalyzeErrors(dataset, request);
        return CellSampleIds(errors.matched_pairs, actual, predicted);
}

namespace {

void RequireDetection(const Dataset &dataset, const char *what) {
        if (dataset.dataset_type() != DatasetType::kDetection)
                throw ValidationError(std::string(what) +
                                      " needs a detection dataset");
}

}  // namespace

std::vector<SampleScore> WorstSamples(const Dataset &dataset,
                                      const EvaluationRequest &request,
                                      std::size_t limit) {
        ValidateRequest(dataset, request);
        RequireDetection(dataset, "worst sample ranking");
        return RankWorstSamples(
            dataset.ground_truths(request.split),
            dataset.predictions(request.source, request.split),
            request.params.iou_threshold, request.params.conf_threshold, limit);
}

std::vector<AnnotationMatch> SampleAnnotationMatches(
    const Dataset &dataset, const EvaluationRequest &request,
    const std::string &sample_id) {
        ValidateRequest(dataset, request);
        RequireDetection(dataset, "annotation matching");
        if (!dataset.has_sample(sample_id))
                throw ValidationError("unknown sample '" + sample_id + "'");
        return MatchSampleAnnotations(
            dataset.ground_truths(), dataset.predictions(request.source),
            sample_id, request.params.iou_threshold,
            request.params.conf_threshold);
}

}  // namespace DetEval
}  // namespace detection_eval
