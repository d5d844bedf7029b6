// Copyright (c) MiXaiLL76
#include "classification_evaluator.h"

#include <map>
#include <set>
#include <unordered_map>
#include <utility>

#include "logger.h"

namespace detection_eval {
namespace DetEval {

namespace {

std::vector<std::string> PairLabels(const std::vector<LabelPair> &pairs,
                                    const std::vector<std::string> &categories) {
        std::set<std::string> labels(categories.begin(), categories.end());
        for (const auto &pair : pairs) {
                labels.insert(pair.actual);
                if (pair.predicted) labels.insert(*pair.predicted);
        }
        return std::vector<std::string>(labels.begin(), labels.end());
}

}  // namespace

std::vector<LabelPair> PairClassificationLabels(
    const std::vector<GroundTruthBox> &ground_truths,
    const std::vector<PredictionBox> &predictions, double conf_threshold) {
        std::map<std::string, std::string> actual_by_sample;
        for (const auto &gt : ground_truths) {
                auto it = actual_by_sample.find(gt.sample_id);
                if (it == actual_by_sample.end()) {
                        actual_by_sample.emplace(gt.sample_id, gt.category);
                } else if (gt.category < it->second) {
                        it->second = gt.category;
                }
        }

        std::unordered_map<std::string, const PredictionBox *> best_by_sample;
        for (const auto &dt : predictions) {
                if (dt.confidence < conf_threshold) continue;
                auto it = best_by_sample.find(dt.sample_id);
                if (it == best_by_sample.end()) {
                        best_by_sample.emplace(dt.sample_id, &dt);
                } else if (dt.confidence > it->second->confidence) {
                        it->second = &dt;
                }
        }

        std::vector<LabelPair> pairs;
        pairs.reserve(actual_by_sample.size());
        for (const auto &kv : actual_by_sample) {
                LabelPair pair;
                pair.sample_id = kv.first;
                pair.actual = kv.second;
                auto it = best_by_sample.find(kv.first);
                if (it != best_by_sample.end()) {
                        pair.predicted = it->second->category;
                        pair.confidence = it->second->confidence;
                }
                pairs.push_back(std::move(pair));
        }
        return pairs;
}

ClassificationEvaluation EvaluateClassification(
    const std::vector<LabelPair> &pairs,
    const std::vector<std::string> &categories, double conf_threshold) {
        const std::vector<std::string> labels = PairLabels(pairs, categories);

        std::vector<std::pair<std::string, std::string>> predicted_pairs;
        std::unordered_map<std::string, int64_t> missing;
        std::set<std::string> observed;
        for (const auto &pair : pairs) {
                observed.insert(pair.actual);
                if (pair.predicted) {
                        observed.insert(*pair.predicted);
                        predicted_pairs.emplace_back(pair.actual,
                                                     *pair.predicted);
                } else {
                        ++missing[pair.actual];
                }
        }

        ClassificationEvaluation result;
        result.conf_threshold = conf_threshold;
        result.confusion_matrix = BuildConfusionMatrix(labels, predicted_pairs);
        const ConfusionMatrix &cm = result.confusion_matrix;

        const int64_t total = cm.total();
        result.accuracy = SafeDivide(static_cast<double>(cm.trace()),
                                     static_cast<double>(total));

        double macro_sum = 0.0, weighted_sum = 0.0;
        std::size_t macro_count = 0;
        for (std::size_t i = 0; i < labels.size(); ++i) {
                ClassificationPerClassMetrics m;
                m.class_name = labels[i];
                const double tp = static_cast<double>(cm.matrix[i][i]);
                m.support = cm.row_sum(i);
                m.precision = SafeDivide(
                    tp, static_cast<double>(cm.column_sum(i)));
                m.recall = SafeDivide(tp, static_cast<double>(m.support));
                m.f1 = SafeDivide(2 * m.precision * m.recall,
                                  m.precision + m.recall);
                auto it = missing.find(labels[i]);
                if (it != missing.end()) m.missing = it->second;

                if (observed.count(labels[i])) {
                        macro_sum += m.f1;
                        ++macro_count;
                }
                weighted_sum += m.f1 * static_cast<double>(m.support);
                result.per_class_metrics.push_back(std::move(m));
        }
        result.macro_f1 =
            SafeDivide(macro_sum, static_cast<double>(macro_count));
        result.weighted_f1 =
            SafeDivide(weighted_sum, static_cast<double>(total));

        logger().debug(
            "classification over {} samples ({} without prediction): "
            "accuracy={:.4f} macro_f1={:.4f}",
            pairs.size(), pairs.size() - predicted_pairs.size(),
            result.accuracy, result.macro_f1);
        return result;
}

ErrorAnalysis CategorizeClassificationErrors(
    const std::vector<LabelPair> &pairs,
    const std::vector<std::string> &categories,
    std::size_t max_samples_per_type) {
        const std::vector<std::string> labels = PairLabels(pairs, categories);

        ErrorAnalysis analysis;
        std::unordered_map<std::string, std::size_t> class_index;
        for (const auto &label : labels) {
                class_index.emplace(label, analysis.per_class.size());
                PerClassErrors errors;
                errors.class_name = label;
                analysis.per_class.push_back(errors);
        }
        for (ErrorType type :
             {ErrorType::kTruePositive, ErrorType::kHardFalsePositive,
              ErrorType::kLabelError, ErrorType::kFalseNegative}) {
                analysis.samples_by_type[ErrorTypeKey(type)];
        }

        auto keep = [&](const LabelPair &pair, ErrorType type,
                        const std::string &category) {
                auto &list = analysis.samples_by_type[ErrorTypeKey(type)];
                if (list.size() < max_samples_per_type) {
                        list.push_back(ErrorSample{pair.sample_id, type,
                                                   category, pair.confidence});
                }
        };

        for (const auto &pair : pairs) {
                PerClassErrors &errors =
                    analysis.per_class[class_index.at(pair.actual)];
                if (!pair.predicted) {
                        ++analysis.summary.false_negatives;
                        ++errors.fn;
                        keep(pair, ErrorType::kFalseNegative, pair.actual);
                        continue;
                }
                if (*pair.predicted == pair.actual) {
                        ++analysis.summary.true_positives;
                        ++errors.tp;
                        keep(pair, ErrorType::kTruePositive, pair.actual);
                } else {
                        ++analysis.summary.label_errors;
                        ++errors.label_error;
                        keep(pair, ErrorType::kLabelError, *pair.predicted);
                }
                analysis.matched_pairs.push_back(
                    MatchedPair{pair.sample_id, pair.actual, *pair.predicted});
        }
        return analysis;
}

}  // namespace DetEval
}  // namespace detection_eval
