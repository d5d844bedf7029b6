// Copyright (c) MiXaiLL76
// Command line front end: loads a dataset document, evaluates one prediction
// source and prints the JSON result.

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "detection_eval/dataset.h"
#include "detection_eval/errors.h"
#include "detection_eval/evaluate.h"
#include "detection_eval/filtered_evaluation.h"
#include "detection_eval/logger.h"
#include "detection_eval/serialization.h"

using nlohmann::json;
namespace DetEval = detection_eval::DetEval;

namespace {

constexpr int kExitValidation = 2;

void usage(const char *argv0) {
        std::cout << "usage: " << argv0
                  << " --dataset FILE --source NAME\n"
                  << "       [--mode evaluate|errors|cell|worst|annotations]\n"
                  << "       [--config FILE] [--iou T] [--conf T] [--split NAME]\n"
                  << "       [--exclude A,B,...] [--actual A --predicted P]\n"
                  << "       [--limit N] [--sample ID] [--out FILE] [--log N]\n"
                  << "  --log N: 0 trace .. 6 off (default 3, warn)\n";
}

json read_json_file(const std::string &path) {
        std::ifstream in(path);
        if (!in.good())
                throw detection_eval::ValidationError("cannot open " + path);
        try {
                return json::parse(in);
        } catch (const json::parse_error &e) {
                throw detection_eval::ValidationError(path + ": " + e.what());
        }
}

// Parses a whole non-negative integer; false on anything else.
bool parse_count(const std::string &text, long *out) {
        if (text.empty() || text[0] == '-') return false;
        char *end = nullptr;
        *out = std::strtol(text.c_str(), &end, 10);
        return end != nullptr && *end == '\0';
}

std::set<std::string> split_list(const std::string &list) {
        std::set<std::string> items;
        std::stringstream ss(list);
        std::string item;
        while (std::getline(ss, item, ',')) {
                if (!item.empty()) items.insert(item);
        }
        return items;
}

}  // namespace

int main(int argc, char **argv) {
        std::string mode = "evaluate";
        std::string dataset_path, config_path, out_path, source;
        std::string iou, conf, split, exclude, actual, predicted, sample;
        long log_level = spdlog::level::warn;
        long limit = 50;

        for (int i = 1; i < argc; ++i) {
                const std::string arg = argv[i];
                if (arg == "-h" || arg == "--help") {
                        usage(argv[0]);
                        return 0;
                } else if (arg == "--dataset" && i + 1 < argc) {
                        dataset_path = argv[++i];
                } else if (arg == "--source" && i + 1 < argc) {
                        source = argv[++i];
                } else if (arg == "--mode" && i + 1 < argc) {
                        mode = argv[++i];
                } else if (arg == "--config" && i + 1 < argc) {
                        config_path = argv[++i];
                } else if (arg == "--iou" && i + 1 < argc) {
                        iou = argv[++i];
                } else if (arg == "--conf" && i + 1 < argc) {
                        conf = argv[++i];
                } else if (arg == "--split" && i + 1 < argc) {
                        split = argv[++i];
                } else if (arg == "--exclude" && i + 1 < argc) {
                        exclude = argv[++i];
                } else if (arg == "--actual" && i + 1 < argc) {
                        actual = argv[++i];
                } else if (arg == "--predicted" && i + 1 < argc) {
                        predicted = argv[++i];
                } else if (arg == "--out" && i + 1 < argc) {
                        out_path = argv[++i];
                } else if (arg == "--sample" && i + 1 < argc) {
                        sample = argv[++i];
                } else if (arg == "--limit" && i + 1 < argc) {
                        if (!parse_count(argv[++i], &limit)) {
                                std::cerr << "invalid --limit: " << argv[i]
                                          << "\n";
                                return kExitValidation;
                        }
                } else if (arg == "--log" && i + 1 < argc) {
                        if (!parse_count(argv[++i], &log_level) ||
                            log_level >= spdlog::level::n_levels) {
                                std::cerr << "invalid --log level: " << argv[i]
                                          << "\n";
                                return kExitValidation;
                        }
                } else {
                        std::cerr << "unknown argument: " << arg << "\n";
                        usage(argv[0]);
                        return kExitValidation;
                }
        }
        spdlog::set_level(static_cast<spdlog::level::level_enum>(log_level));
        detection_eval::logger().set_level(
            static_cast<spdlog::level::level_enum>(log_level));

        if (dataset_path.empty()) {
                usage(argv[0]);
                return kExitValidation;
        }

        try {
                const DetEval::Dataset dataset =
                    DetEval::Dataset::from_json(read_json_file(dataset_path));

                // Command line values override the config file.
                json request = config_path.empty() ? json::object()
                                                   : read_json_file(config_path);
                if (!request.is_object())
                        throw detection_eval::ValidationError(
                            "config must be a JSON object");
                request["dataset_id"] = dataset.dataset_id();
                request["source"] = source;
                if (!iou.empty()) request["iou_threshold"] = iou;
                if (!conf.empty()) request["conf_threshold"] = conf;
                if (!split.empty()) request["split"] = split;

                const DetEval::EvaluationRequest parsed =
                    DetEval::RequestFromJson(request);
                json result;
                if (mode == "evaluate") {
                        DetEval::EvaluationResult evaluation =
                            DetEval::Evaluate(dataset, parsed);
                        const auto excluded = split_list(exclude);
                        if (!excluded.empty()) {
                                auto *detection =
                                    std::get_if<DetEval::DetectionEvaluation>(
                                        &evaluation);
                                if (detection == nullptr)
                                        throw detection_eval::ValidationError(
                                            "--exclude applies to detection "
                                            "datasets only");
                                evaluation = DetEval::FilterEvaluation(
                                    *detection, excluded);
                        }
                        result = DetEval::ResultToJson(evaluation);
                } else if (mode == "errors") {
                        result = DetEval::AnalyzeErrors(dataset, parsed);
                } else if (mode == "cell") {
                        if (actual.empty() || predicted.empty())
                                throw detection_eval::ValidationError(
                                    "cell mode needs --actual and --predicted");
                        const auto ids = DetEval::ConfusionCellSamples(
                            dataset, parsed, actual, predicted);
                        result = json{{"actual_class", actual},
                                      {"predicted_class", predicted},
                                      {"sample_ids", ids},
                                      {"count", ids.size()}};
                } else if (mode == "worst") {
                        result = DetEval::WorstSamples(
                            dataset, parsed, static_cast<std::size_t>(limit));
                } else if (mode == "annotations") {
                        if (sample.empty())
                                throw detection_eval::ValidationError(
                                    "annotations mode needs --sample");
                        result = json{{"sample_id", sample},
                                      {"annotations",
                                       DetEval::SampleAnnotationMatches(
                                           dataset, parsed, sample)}};
                } else {
                        throw detection_eval::ValidationError("unknown mode '" +
                                                              mode + "'");
                }

                if (out_path.empty()) {
                        std::cout << result.dump(2) << std::endl;
                } else {
                        std::ofstream out(out_path);
                        if (!out.good())
                                throw std::runtime_error("cannot write " +
                                                         out_path);
                        out << result.dump(2) << std::endl;
                        detection_eval::logger().info("wrote {}", out_path);
                }
        } catch (const detection_eval::ValidationError &e) {
                detection_eval::logger().error("{}", e.what());
                return kExitValidation;
        } catch (const std::exception &e) {
                detection_eval::logger().error("{}", e.what());
                return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
}
