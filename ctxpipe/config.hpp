/*
 * config.hpp  Andrew Belles  Nov 28th, 2025
 *
 * Pipeline configuration. One JSON document describes the store, logging,
 * fetching, services, extraction and retrieval knobs and the topic seeds.
 * Every key is optional and falls back to the struct defaults, unknown keys
 * are ignored
 *
 */

#ifndef __CTXPIPE_CONFIG_HPP
#define __CTXPIPE_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "ctxpipe/crawler/crawler_support.hpp"
#include "ctxpipe/extract/rules.hpp"
#include "ctxpipe/logging.hpp"
#include "ctxpipe/rank/retriever.hpp"
#include "ctxpipe/services/services.hpp"

namespace cfg {

struct RateLimitConfig {
  millis min_delay{1000};
  crwl::RateLimitScope scope{crwl::RateLimitScope::Process};
  bool shared{false};               // one limiter for every topic crawl
};

struct PipelineConfig {
  std::string store_path{"ctxpipe.db"};
  size_t workers{2};
  lgr::LogConfig logging{};
  crwl::FetchConfig fetch{};
  RateLimitConfig rate_limit{};
  svc::ServicesConfig services{};
  xtr::ExtractConfig extraction{};
  rnk::RetrievalConfig retrieval{};
  std::vector<crwl::TopicSeed> topics{};

  const crwl::TopicSeed* find_topic(std::string_view name) const noexcept;
};

/************ parse_config() ******************************/
/* Caller Provides:
 *   the JSON text of a pipeline configuration
 *
 * Throws:
 *   invalid_argument naming the offending key for a value of the wrong type
 *   or outside its range, runtime_error for text that is not JSON
 */
PipelineConfig parse_config(std::string_view text);

// Reads path and hands it to parse_config. Throws runtime_error when the
// file cannot be read
PipelineConfig load_config(const std::string& path);

} // end namespace cfg

#endif // !__CTXPIPE_CONFIG_HPP
