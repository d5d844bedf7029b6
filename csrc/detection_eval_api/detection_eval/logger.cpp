// Copyright (c) MiXaiLL76
#include "logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace detection_eval {

namespace {
std::shared_ptr<spdlog::logger> &shared_logger() {
        static std::shared_ptr<spdlog::logger> instance;
        return instance;
}
}  // namespace

spdlog::logger &logger() {
        auto &instance = shared_logger();
        if (!instance) {
                instance = spdlog::get("detection_eval");
                if (!instance) {
                        instance =
                            spdlog::stderr_color_mt("detection_eval");
                        instance->set_level(spdlog::level::warn);
                }
        }
        return *instance;
}

void set_logger(std::shared_ptr<spdlog::logger> new_logger) {
        shared_logger() = std::move(new_logger);
}

}  // namespace detection_eval
