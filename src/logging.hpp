#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

// Colored stderr logger for the CLI; stdout stays free for printed results.
std::shared_ptr<spdlog::logger> setup_logging(bool verbose, const std::string& name = "webscout");

// Logger that drops everything, for tests and embedding.
std::shared_ptr<spdlog::logger> null_logger(const std::string& name = "webscout-null");
