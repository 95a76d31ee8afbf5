#pragma once

#include "daemon/log_multiplexer.hpp"

#include <memory>
#include <string>

namespace spdlog { class logger; }

struct AppConfig;

/// Install the "botwarden" logger as spdlog's default and create the "worker"
/// logger on the same sinks: colour console, plus a rotating file when
/// log_file is set. Safe to call more than once.
void init_logging(const AppConfig& config);

/// The logger worker output goes to; created on first use if init_logging
/// has not run.
std::shared_ptr<spdlog::logger> worker_logger();

/// Log sink that writes worker stdout at info and stderr at error level
LogSink make_worker_log_sink();
