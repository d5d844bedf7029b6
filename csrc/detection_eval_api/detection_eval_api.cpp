// Copyright (c) MiXaiLL76
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11_json/pybind11_json.hpp>

#include <memory>
#include <set>
#include <sstream>
#include <string>

#include "detection_eval/dataset.h"
#include "detection_eval/errors.h"
#include "detection_eval/evaluate.h"
#include "detection_eval/filtered_evaluation.h"
#include "detection_eval/serialization.h"

// Stringification macros for version info
#define STRINGIFY(x) #x
#define MACRO_STRINGIFY(x) STRINGIFY(x)

namespace py = pybind11;

namespace detection_eval {

using DetEval::json;

// Returns the compiler version as a string.
std::string get_compiler_version() {
        std::ostringstream ss;
#if defined(__GNUC__) && !defined(__clang__)
        ss << "GCC " << __GNUC__ << "." << __GNUC_MINOR__;
#endif

#if defined(__clang_major__)
        ss << "clang " << __clang_major__ << "." << __clang_minor__ << "."
           << __clang_patchlevel__;
#endif

#if defined(_MSC_VER)
        ss << "MSVC " << _MSC_FULL_VER;
#endif
        return ss.str();
}

PYBIND11_MODULE(detection_eval_api_cpp, m) {
        py::register_exception<ValidationError>(m, "ValidationError",
                                                PyExc_ValueError);

        m.def("get_compiler_version", &get_compiler_version,
              "Returns the compiler version used for compilation.");

        // Requests and results cross the boundary as dicts.
        m.def(
            "evaluate",
            [](const DetEval::Dataset &dataset, const json &request) {
                    return DetEval::ResultToJson(DetEval::Evaluate(
                        dataset, DetEval::RequestFromJson(request)));
            },
            py::arg("dataset"), py::arg("request"),
            "Detection or classification metrics, by dataset type.");
        m.def(
            "analyze_errors",
            [](const DetEval::Dataset &dataset, const json &request) {
                    return json(DetEval::AnalyzeErrors(
                        dataset, DetEval::RequestFromJson(request)));
            },
            py::arg("dataset"), py::arg("request"),
            "TP / hard FP / label error / FN breakdown.");
        m.def(
            "confusion_cell_samples",
            [](const DetEval::Dataset &dataset, const json &request,
               const std::string &actual, const std::string &predicted) {
                    return DetEval::ConfusionCellSamples(
                        dataset, DetEval::RequestFromJson(request), actual,
                        predicted);
            },
            py::arg("dataset"), py::arg("request"), py::arg("actual"),
            py::arg("predicted"),
            "Sample ids contributing to one confusion matrix cell.");
        m.def(
            "worst_samples",
            [](const DetEval::Dataset &dataset, const json &request,
               std::size_t limit) {
                    return json(DetEval::WorstSamples(
                        dataset, DetEval::RequestFromJson(request), limit));
            },
            py::arg("dataset"), py::arg("request"), py::arg("limit") = 50,
            "Samples ranked by error count and confidence spread.");
        m.def(
            "match_sample_annotations",
            [](const DetEval::Dataset &dataset, const json &request,
               const std::string &sample_id) {
                    return json(DetEval::SampleAnnotationMatches(
                        dataset, DetEval::RequestFromJson(request), sample_id));
            },
            py::arg("dataset"), py::arg("request"), py::arg("sample_id"),
            "tp / label_error / fp / fn label of every annotation of a "
            "sample.");
        m.def(
            "filter_evaluation",
            [](const json &evaluation, const std::set<std::string> &excluded) {
                    return json(DetEval::FilterEvaluation(
                        evaluation.get<DetEval::DetectionEvaluation>(),
                        excluded));
            },
            py::arg("evaluation"), py::arg("excluded"),
            "Detection evaluation without the excluded classes.");

        py::class_<DetEval::FilteredEvaluationCache>(m,
                                                     "FilteredEvaluationCache")
            .def(py::init([](const json &evaluation) {
                    return DetEval::FilteredEvaluationCache(
                        std::make_shared<const DetEval::DetectionEvaluation>(
                            evaluation.get<DetEval::DetectionEvaluation>()));
            }))
            .def("get",
                 [](DetEval::FilteredEvaluationCache &cache,
                    const std::set<std::string> &excluded) {
                         return json(cache.Get(excluded));
                 })
            .def("reset",
                 [](DetEval::FilteredEvaluationCache &cache,
                    const json &evaluation) {
                         cache.Reset(
                             std::make_shared<const DetEval::DetectionEvaluation>(
                                 evaluation
                                     .get<DetEval::DetectionEvaluation>()));
                 })
            .def("__len__", &DetEval::FilteredEvaluationCache::size);

        // Expose Dataset with methods and pickle support
        py::class_<DetEval::Dataset>(m, "Dataset")
            .def(py::init([](const std::string &dataset_id,
                             const std::string &dataset_type) {
                         return DetEval::Dataset(
                             dataset_id, DetEval::ParseDatasetType(dataset_type));
                 }),
                 py::arg("dataset_id"), py::arg("dataset_type") = "detection")
            .def("append", &DetEval::Dataset::append)
            .def("add_category", &DetEval::Dataset::add_category)
            .def("set_split", &DetEval::Dataset::set_split)
            .def("clean", &DetEval::Dataset::clean)
            .def("categories", &DetEval::Dataset::categories)
            .def("sources", &DetEval::Dataset::sources)
            .def("to_json", &DetEval::Dataset::to_json)
            .def_static("from_json", &DetEval::Dataset::from_json)
            .def_property_readonly("dataset_id",
                                   &DetEval::Dataset::dataset_id)
            .def("__len__",
                 [](const DetEval::Dataset &p) { return p.size(); })
            .def(py::pickle(
                [](const DetEval::Dataset &p) {
                        return py::make_tuple(static_cast<int>(p.size()),
                                              p.to_json().dump());
                },
                [](py::tuple t) {
                        if (t.size() != 2)
                                throw std::runtime_error(
                                    "Invalid state! Tuple must have 2 "
                                    "elements.");
                        return DetEval::Dataset::from_json(
                            json::parse(t[1].cast<std::string>()));
                }));

        // Set the version attribute
#ifdef VERSION_INFO
        m.attr("__version__") = MACRO_STRINGIFY(VERSION_INFO);
#else
        m.attr("__version__") = "dev";
#endif
}

}  // namespace detection_eval
