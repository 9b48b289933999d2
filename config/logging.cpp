/*
 * logging.cpp  Andrew Belles  Nov 20th, 2025
 *
 */

#include "ctxpipe/logging.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

struct LogState {
  std::mutex mu;
  std::vector<spdlog::sink_ptr> sinks;
  spdlog::level::level_enum level{spdlog::level::info};
  std::vector<std::string> names;
};

LogState&
state_()
{
  static LogState st;
  return st;
}

void
ensure_sinks_(LogState& st)
{
  if ( st.sinks.empty() ) {
    st.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
}

std::shared_ptr<spdlog::logger>
build_(LogState& st, const std::string& name)
{
  auto logger = std::make_shared<spdlog::logger>(name, st.sinks.begin(), st.sinks.end());
  logger->set_level(st.level);
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
  spdlog::register_logger(logger);
  return logger;
}

}

namespace lgr {

void
init(const LogConfig& cfg)
{
  const auto level = spdlog::level::from_str(cfg.level);
  if ( level == spdlog::level::off && cfg.level != "off" ) {
    throw std::invalid_argument("lgr::init: unknown log level '" + cfg.level + "'");
  }

  auto& st = state_();
  std::lock_guard<std::mutex> lock(st.mu);

  st.sinks.clear();
  st.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if ( !cfg.file.empty() ) {
    st.sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
  }
  st.level = level;

  // rebuild anything handed out so far on the new sinks
  for (const auto& name : st.names) {
    spdlog::drop(name);
    build_(st, name);
  }
}

std::shared_ptr<spdlog::logger>
get(const std::string& name)
{
  auto& st = state_();
  std::lock_guard<std::mutex> lock(st.mu);

  if ( auto existing = spdlog::get(name) ) {
    return existing;
  }

  ensure_sinks_(st);
  st.names.push_back(name);
  return build_(st, name);
}

}
