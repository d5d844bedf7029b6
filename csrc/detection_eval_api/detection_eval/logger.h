// Copyright (c) MiXaiLL76
#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace detection_eval {

// Shared "detection_eval" logger, created on first use.
spdlog::logger &logger();

// Replaces the shared logger, e.g. to route messages into a test sink.
void set_logger(std::shared_ptr<spdlog::logger> new_logger);

}  // namespace detection_eval
