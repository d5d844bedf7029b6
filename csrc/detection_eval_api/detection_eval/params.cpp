// Copyright (c) MiXaiLL76
#include "params.h"

#include <cmath>
#include <string>

#include "errors.h"

namespace detection_eval {
namespace DetEval {

namespace {

void ValidateThreshold(const char *name, double value) {
        if (std::isnan(value) || value < 0.0 || value > 1.0) {
                throw ValidationError(std::string(name) +
                                      " must be within [0, 1], got " +
                                      std::to_string(value));
        }
}

double ReadNumber(const json &config, const char *key) {
        const json &value = config.at(key);
        if (value.is_number()) return value.get<double>();
        if (value.is_string()) {
                const std::string text = value.get<std::string>();
                try {
                        std::size_t pos = 0;
                        const double number = std::stod(text, &pos);
                        if (pos == text.size()) return number;
                } catch (const std::exception &) {
                        // fall through to the error below
                }
        }
        throw ValidationError(std::string("config key '") + key +
                              "' must be a number");
}

std::size_t ReadCount(const json &config, const char *key) {
        const json &value = config.at(key);
        if (!value.is_number_integer() || value.get<int64_t>() < 0) {
                throw ValidationError(std::string("config key '") + key +
                                      "' must be a non-negative integer");
        }
        return value.get<std::size_t>();
}

}  // namespace

std::vector<double> Linspace(double start, double stop, std::size_t num) {
        std::vector<double> values;
        if (num == 0) return values;
        values.reserve(num);
        if (num == 1) {
                values.push_back(start);
                return values;
        }
        const double step = (stop - start) / static_cast<double>(num - 1);
        for (std::size_t i = 0; i < num; ++i) {
                values.push_back(start + static_cast<double>(i) * step);
        }
        values.back() = stop;
        return values;
}

Params::Params()
    : iou_thresholds(Linspace(0.5, 0.95, 10)),
      recall_thresholds(Linspace(0.0, 1.0, 101)) {}

void Params::Validate() const {
        ValidateThreshold("iou_threshold", iou_threshold);
        ValidateThreshold("conf_threshold", conf_threshold);
        if (iou_thresholds.empty())
                throw ValidationError("iou_thresholds must not be empty");
        for (double t : iou_thresholds) ValidateThreshold("iou_thresholds", t);
        if (recall_thresholds.empty())
                throw ValidationError("recall_thresholds must not be empty");
        for (double r : recall_thresholds)
                ValidateThreshold("recall_thresholds", r);
}

Params Params::FromJson(const json &config) {
        Params params;
        if (!config.is_object()) {
                throw ValidationError("config must be a JSON object");
        }
        if (config.contains("iou_thresholds")) {
                const json &list = config["iou_thresholds"];
                if (!list.is_array())
                        throw ValidationError(
                            "config key 'iou_thresholds' must be an array");
                params.iou_thresholds.clear();
                for (const auto &item : list) {
                        if (!item.is_number())
                                throw ValidationError(
                                    "config key 'iou_thresholds' must hold "
                                    "numbers");
                        params.iou_thresholds.push_back(item.get<double>());
                }
        }
        if (config.contains("recall_points")) {
                const std::size_t points = ReadCount(config, "recall_points");
                if (points < 2)
                        throw ValidationError(
                            "config key 'recall_points' must be at least 2");
                params.recall_thresholds = Linspace(0.0, 1.0, points);
        }
        if (config.contains("iou_threshold"))
                params.iou_threshold = ReadNumber(config, "iou_threshold");
        if (config.contains("conf_threshold"))
                params.conf_threshold = ReadNumber(config, "conf_threshold");
        if (config.contains("max_samples_per_type"))
                params.max_samples_per_type =
                    ReadCount(config, "max_samples_per_type");
        if (config.contains("max_curve_points"))
                params.max_curve_points = ReadCount(config, "max_curve_points");

        params.Validate();
        return params;
}

json Params::ToJson() const {
        return json{{"iou_thresholds", iou_thresholds},
                    {"recall_points", recall_thresholds.size()},
                    {"iou_threshold", iou_threshold},
                    {"conf_threshold", conf_threshold},
                    {"max_samples_per_type", max_samples_per_type},
                    {"max_curve_points", max_curve_points}};
}

}  // namespace DetEval
}  // namespace detection_eval
