/*
 * config.cpp  Andrew Belles  Nov 28th, 2025
 *
 */

#include "ctxpipe/config.hpp"
#include "ctxpipe/crawler/http.hpp"
#include "ctxpipe/crawler/json.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

namespace json = boost::json;

[[noreturn]] static void
bad_(const std::string& path, const std::string& what)
{
  throw std::invalid_argument("config: '" + path + "' " + what);
}

static std::string
key_path_(const std::string& prefix, std::string_view key)
{
  return prefix.empty() ? std::string(key) : prefix + "." + std::string(key);
}

static const json::object*
section_(const json::object& obj, std::string_view key, const std::string& prefix)
{
  const auto* v = obj.if_contains(key);
  if ( !v || v->is_null() ) {
    return nullptr;
  }
  if ( !v->is_object() ) {
    bad_(key_path_(prefix, key), "must be an object");
  }
  return &v->as_object();
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix, std::string& out)
{
  const auto* v = obj.if_contains(key);
  if ( !v || v->is_null() ) {
    return;
  }
  if ( !v->is_string() ) {
    bad_(key_path_(prefix, key), "must be a string");
  }
  out = v->as_string().c_str();
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix, bool& out)
{
  const auto* v = obj.if_contains(key);
  if ( !v || v->is_null() ) {
    return;
  }
  if ( !v->is_bool() ) {
    bad_(key_path_(prefix, key), "must be true or false");
  }
  out = v->as_bool();
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix, size_t& out)
{
  const auto* v = obj.if_contains(key);
  if ( !v || v->is_null() ) {
    return;
  }
  if ( v->is_uint64() ) {
    out = static_cast<size_t>(v->as_uint64());
  } else if ( v->is_int64() && v->as_int64() >= 0 ) {
    out = static_cast<size_t>(v->as_int64());
  } else {
    bad_(key_path_(prefix, key), "must be a non-negative integer");
  }
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix, double& out)
{
  const auto* v = obj.if_contains(key);
  if ( !v || v->is_null() ) {
    return;
  }
  if ( !v->is_number() ) {
    bad_(key_path_(prefix, key), "must be a number");
  }
  out = v->to_number<double>();
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix, millis& out)
{
  size_t ms = static_cast<size_t>(out.count());
  read_(obj, key, prefix, ms);
  out = millis{static_cast<millis::rep>(ms)};
}

static void
read_(const json::object& obj, std::string_view key, const std::string& prefix,
      std::vector<std::string>& out)
{
  if ( !obj.contains(key) || obj.at(key).is_null() ) {
    return;
  }
  try {
    out = jsc::string_list(obj, key);
  } catch (const std::runtime_error&) {
    bad_(key_path_(prefix, key), "must be an array of strings");
  }
}

static void
read_service_(const json::object& obj, std::string_view key, const std::string& prefix,
              svc::ServiceConfig& out)
{
  const auto path = key_path_(prefix, key);
  const auto* s = section_(obj, key, prefix);
  if ( !s ) {
    return;
  }

  read_(*s, "enabled", path, out.enabled);
  read_(*s, "endpoint", path, out.endpoint);
  read_(*s, "model", path, out.model);
  read_(*s, "api_key", path, out.api_key);
  read_(*s, "timeout_ms", path, out.timeout);

  if ( out.enabled ) {
    try {
      (void)htc::parse_url(out.endpoint);
    } catch (const std::invalid_argument& e) {
      bad_(path + ".endpoint", e.what());
    }
  }
}

static crwl::CrawlPolicy
read_policy_(const json::object& obj, const std::string& path)
{
  crwl::CrawlPolicy policy{};
  read_(obj, "max_depth", path, policy.max_depth);
  read_(obj, "max_docs_per_topic", path, policy.max_docs_per_topic);
  read_(obj, "required_keywords", path, policy.required_keywords);
  if ( policy.required_keywords.empty() ) {
    bad_(path + ".required_keywords", "must name at least one keyword");
  }
  read_(obj, "optional_keywords", path, policy.optional_keywords);
  read_(obj, "exclude_patterns", path, policy.exclude_patterns);
  read_(obj, "min_content_chars", path, policy.min_content_chars);
  read_(obj, "fetch_timeout_ms", path, policy.fetch_timeout);

  std::string strategy{crwl::to_string(policy.fetch_strategy)};
  read_(obj, "fetch_strategy", path, strategy);
  auto kind = crwl::parse_strategy(strategy);
  if ( !kind ) {
    bad_(path + ".fetch_strategy", "must be \"lightweight\" or \"rendering\"");
  }
  policy.fetch_strategy = *kind;

  if ( policy.fetch_timeout.count() == 0 ) {
    bad_(path + ".fetch_timeout_ms", "must be greater than zero");
  }
  return policy;
}

static std::vector<crwl::TopicSeed>
read_topics_(const json::object& root)
{
  std::vector<crwl::TopicSeed> topics;
  const auto* v = root.if_contains("topics");
  if ( !v || v->is_null() ) {
    return topics;
  }
  if ( !v->is_array() ) {
    bad_("topics", "must be an array");
  }

  size_t i = 0;
  for (const auto& item : v->as_array()) {
    const std::string path = "topics[" + std::to_string(i++) + "]";
    if ( !item.is_object() ) {
      bad_(path, "must be an object");
    }
    const auto& obj = item.as_object();

    crwl::TopicSeed seed{};
    read_(obj, "topic", path, seed.topic);
    if ( seed.topic.empty() ) {
      bad_(path + ".topic", "is required");
    }
    for (const auto& t : topics) {
      if ( t.topic == seed.topic ) {
        bad_(path + ".topic", "duplicates topic '" + seed.topic + "'");
      }
    }

    read_(obj, "seed_urls", path, seed.seed_urls);
    if ( seed.seed_urls.empty() ) {
      bad_(path + ".seed_urls", "needs at least one url");
    }
    for (const auto& url : seed.seed_urls) {
      try {
        (void)htc::parse_url(url);
      } catch (const std::invalid_argument& e) {
        bad_(path + ".seed_urls", e.what());
      }
    }

    if ( const auto* p = section_(obj, "crawl_policy", path) ) {
      seed.policy = read_policy_(*p, path + ".crawl_policy");
    }
    topics.push_back(std::move(seed));
  }
  return topics;
}

static void
read_extraction_(const json::object& root, xtr::ExtractConfig& out)
{
  const std::string path = "extraction";
  const auto* s = section_(root, "extraction", "");
  if ( !s ) {
    return;
  }

  read_(*s, "min_category_hits", path, out.min_category_hits);
  read_(*s, "min_general_hits", path, out.min_general_hits);
  read_(*s, "summary_chars", path, out.summary_chars);
  read_(*s, "max_key_points", path, out.max_key_points);
  read_(*s, "assist_chars", path, out.assist_chars);
  read_(*s, "general_markers", path, out.general_markers);

  // object order is configuration order, which breaks category ties
  if ( const auto* cats = section_(*s, "categories", path) ) {
    out.categories.clear();
    for (const auto& kv : *cats) {
      xtr::CategorySpec spec{std::string(kv.key()), {}};
      read_(*cats, kv.key(), path + ".categories", spec.keywords);
      if ( spec.keywords.empty() ) {
        bad_(path + ".categories." + spec.name, "needs at least one keyword");
      }
      out.categories.push_back(std::move(spec));
    }
  }

  if ( out.min_category_hits == 0 || out.min_general_hits == 0 ) {
    bad_(path, "minimum hit counts must be at least 1");
  }
}

static void
read_retrieval_(const json::object& root, rnk::RetrievalConfig& out)
{
  const std::string path = "retrieval";
  const auto* s = section_(root, "retrieval", "");
  if ( !s ) {
    return;
  }

  read_(*s, "semantic_weight", path, out.semantic_weight);
  read_(*s, "keyword_weight", path, out.keyword_weight);
  read_(*s, "rerank_pool", path, out.rerank_pool);
  read_(*s, "max_items", path, out.max_items);
  read_(*s, "token_budget", path, out.token_budget);
  read_(*s, "include_documents", path, out.include_documents);
  read_(*s, "excerpt_chars", path, out.excerpt_chars);

  if ( const auto* aliases = section_(*s, "topic_aliases", path) ) {
    for (const auto& kv : *aliases) {
      if ( !kv.value().is_string() ) {
        bad_(path + ".topic_aliases." + std::string(kv.key()), "must be a string");
      }
      out.topic_aliases[std::string(kv.key())] = kv.value().as_string().c_str();
    }
  }

  if ( out.semantic_weight < 0.0 || out.keyword_weight < 0.0 ||
       out.semantic_weight + out.keyword_weight <= 0.0 ) {
    bad_(path, "weights must be non-negative and not both zero");
  }
  if ( out.max_items == 0 ) {
    bad_(path + ".max_items", "must be at least 1");
  }
  if ( out.rerank_pool == 0 ) {
    bad_(path + ".rerank_pool", "must be at least 1");
  }
}

}

namespace cfg {

const crwl::TopicSeed*
PipelineConfig::find_topic(std::string_view name) const noexcept
{
  for (const auto& t : topics) {
    if ( t.topic == name ) {
      return &t;
    }
  }
  return nullptr;
}

PipelineConfig
parse_config(std::string_view text)
{
  const auto root_value = jsc::parse(text);
  if ( !root_value.is_object() ) {
    throw std::invalid_argument("config: top level must be an object");
  }
  const auto& root = root_value.as_object();

  PipelineConfig out{};
  read_(root, "store_path", "", out.store_path);
  read_(root, "workers", "", out.workers);
  if ( out.workers == 0 ) {
    bad_("workers", "must be at least 1");
  }

  if ( const auto* s = section_(root, "logging", "") ) {
    read_(*s, "level", "logging", out.logging.level);
    read_(*s, "file", "logging", out.logging.file);
    if ( spdlog::level::from_str(out.logging.level) == spdlog::level::off &&
         out.logging.level != "off" ) {
      bad_("logging.level", "unknown level '" + out.logging.level + "'");
    }
  }

  if ( const auto* s = section_(root, "fetch", "") ) {
    read_(*s, "user_agent", "fetch", out.fetch.user_agent);
    read_(*s, "max_redirects", "fetch", out.fetch.max_redirects);
    read_(*s, "max_body_bytes", "fetch", out.fetch.max_body_bytes);
    read_(*s, "render_endpoint", "fetch", out.fetch.render_endpoint);
    read_(*s, "render_token", "fetch", out.fetch.render_token);
    read_(*s, "render_wait_until", "fetch", out.fetch.render_wait_until);
    read_(*s, "render_settle_ms", "fetch", out.fetch.render_settle);
    if ( out.fetch.user_agent.empty() ) {
      bad_("fetch.user_agent", "must not be empty");
    }
  }

  if ( const auto* s = section_(root, "rate_limit", "") ) {
    read_(*s, "min_delay_ms", "rate_limit", out.rate_limit.min_delay);
    read_(*s, "shared", "rate_limit", out.rate_limit.shared);

    std::string scope = "process";
    read_(*s, "scope", "rate_limit", scope);
    auto parsed = crwl::parse_scope(scope);
    if ( !parsed ) {
      bad_("rate_limit.scope", "must be \"process\" or \"domain\"");
    }
    out.rate_limit.scope = *parsed;
  }

  if ( const auto* s = section_(root, "services", "") ) {
    read_service_(*s, "embedding", "services", out.services.embedding);
    read_service_(*s, "rerank", "services", out.services.rerank);
    read_service_(*s, "assist", "services", out.services.assist);
  }

  read_extraction_(root, out.extraction);
  read_retrieval_(root, out.retrieval);
  out.topics = read_topics_(root);
  return out;
}

PipelineConfig
load_config(const std::string& path)
{
  std::ifstream in(path, std::ios::binary);
  if ( !in ) {
    throw std::runtime_error("config: cannot open " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();

  try {
    return parse_config(buf.str());
  } catch (const std::invalid_argument&) {
    throw;
  } catch (const std::exception&) {
    std::throw_with_nested(std::runtime_error("config: cannot parse " + path));
  }
}

}
