/*
 * logging.hpp  Andrew Belles  Nov 20th, 2025
 *
 * Named spdlog loggers shared across the pipeline. Every component asks for
 * its logger by name, all of them write through the same sinks
 *
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace lgr {

struct LogConfig {
  std::string level{"info"};        // trace, debug, info, warn, error, critical, off
  std::string file{};               // optional log file, appended to
};

/************ init() **************************************/
/* Installs the sinks and level. Loggers created before init() are rebuilt
 * on the new sinks.
 *
 * Throws:
 *   invalid_argument for an unknown level name
 *   spdlog_ex when the log file cannot be opened
 */
void init(const LogConfig& cfg);

/************ get() ***************************************/
/* Returns the logger registered under name, creating it on first use.
 * Safe to call before init(), a console sink is used then
 */
std::shared_ptr<spdlog::logger> get(const std::string& name);

}
