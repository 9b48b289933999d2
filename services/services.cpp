/*
 * services.cpp  Andrew Belles  Nov 22nd, 2025
 *
 * HTTP clients for the embedding, rerank and assist ports
 *
 */

#include "ctxpipe/services/services.hpp"
#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/logging.hpp"

#include <cmath>
#include <limits>

#include <boost/json.hpp>

namespace json = boost::json;

namespace {

constexpr svc::millis kProbeTimeout{2000};

static htc::Url
with_target_(htc::Url base, std::string_view path)
{
  std::string target = base.target;
  while ( !target.empty() && target.back() == '/' ) {
    target.pop_back();
  }
  target += path;
  base.target = std::move(target);
  return base;
}

/************ ping_() ************************************/
/* One GET against the service. Any answer below 500 counts as reachable,
 * transport errors and timeouts do not
 */
static bool
ping_(const char* service, const htc::Url& base, std::string_view path,
       const svc::ServiceConfig& cfg)
{
  auto log = lgr::get("services");
  htc::Request req{};
  req.accept  = "application/json";
  req.api_key = cfg.api_key;
  req.timeout = kProbeTimeout;

  try {
    auto res = htc::request(with_target_(base, path), req);
    if ( res.status >= 500 ) {
      log->warn("{} service at {} answered {}, disabled", service, cfg.endpoint, res.status);
      return false;
    }
    log->info("{} service available at {} (model '{}')", service, cfg.endpoint, cfg.model);
    return true;
  } catch (const std::exception& e) {
    log->warn("{} service at {} unreachable, disabled: {}", service, cfg.endpoint, e.what());
    return false;
  }
}

/************ post_json_() ********************************/
/* POSTs body as json and parses the reply.
 *
 * Throws:
 *   svc::ServiceError for transport errors, non 2xx answers and bad json
 */
static json::value
post_json_(const htc::Url& base, std::string_view path, const json::value& body,
           const svc::ServiceConfig& cfg)
{
  htc::Request req{};
  req.method       = htc::Method::Post;
  req.accept       = "application/json";
  req.content_type = "application/json";
  req.body         = json::serialize(body);
  req.api_key      = cfg.api_key;
  req.timeout      = cfg.timeout;

  htc::Response res;
  try {
    res = htc::request(with_target_(base, path), req);
  } catch (const std::exception& e) {
    throw svc::ServiceError(std::string(path) + ": " + e.what());
  }

  if ( res.status < 200 || res.status >= 300 ) {
    throw svc::ServiceError(std::string(path) + ": HTTP status " + std::to_string(res.status));
  }

  try {
    return jsc::parse(res.body);
  } catch (const std::exception& e) {
    throw svc::ServiceError(std::string(path) + ": " + e.what());
  }
}

}

namespace svc {

OllamaEmbedding::OllamaEmbedding(ServiceConfig cfg)
  : cfg_(std::move(cfg)), base_(htc::parse_url(cfg_.endpoint))
{
  available_ = ping_("embedding", base_, "/api/tags", cfg_);
}

std::vector<float>
OllamaEmbedding::embed(const std::string& text)
{
  json::object body;
  body["model"]  = cfg_.model;
  body["prompt"] = text;

  auto reply = post_json_(base_, "/api/embeddings", body, cfg_);
  const auto* vec = reply.is_object() ? reply.as_object().if_contains("embedding") : nullptr;
  if ( !vec || !vec->is_array() ) {
    throw ServiceError("/api/embeddings: reply carries no embedding");
  }

  std::vector<float> out;
  out.reserve(vec->as_array().size());
  for (const auto& x : vec->as_array()) {
    if ( !x.is_number() ) {
      throw ServiceError("/api/embeddings: non numeric component");
    }
    const double d = x.to_number<double>();
    if ( !std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max() ) {
      throw ServiceError("/api/embeddings: component out of range");
    }
    out.push_back(static_cast<float>(d));
  }
  if ( out.empty() ) {
    throw ServiceError("/api/embeddings: empty embedding");
  }
  return out;
}

TeiRerank::TeiRerank(ServiceConfig cfg)
  : cfg_(std::move(cfg)), base_(htc::parse_url(cfg_.endpoint))
{
  available_ = ping_("rerank", base_, "/health", cfg_);
}

std::vector<double>
TeiRerank::rerank(const std::string& query, const std::vector<std::string>& texts)
{
  if ( texts.empty() ) {
    return {};
  }

  json::object body;
  body["query"]    = query;
  body["texts"]    = jsc::to_array(texts);
  body["truncate"] = true;
  if ( !cfg_.model.empty() ) {
    body["model"] = cfg_.model;
  }

  return parse_rerank_reply(post_json_(base_, "/rerank", body, cfg_), texts.size());
}

std::vector<double>
parse_rerank_reply(const json::value& reply, size_t n)
{
  if ( !reply.is_array() ) {
    throw ServiceError("/rerank: expected an array reply");
  }

  std::vector<double> scores(n, 0.0);
  std::vector<bool> filled(n, false);
  for (const auto& item : reply.as_array()) {
    if ( !item.is_object() ) {
      throw ServiceError("/rerank: malformed entry");
    }
    const auto& entry = item.as_object();
    const auto* idx   = entry.if_contains("index");
    const auto* score = entry.if_contains("score");
    if ( !idx || !score || !score->is_number() ) {
      throw ServiceError("/rerank: entry missing index or score");
    }

    // integral json numbers only, 1.5 or 2^64 are not positions
    size_t i = n;
    if ( idx->is_int64() && idx->get_int64() >= 0 ) {
      i = static_cast<size_t>(idx->get_int64());
    } else if ( idx->is_uint64() && idx->get_uint64() < n ) {
      i = static_cast<size_t>(idx->get_uint64());
    } else if ( !idx->is_int64() && !idx->is_uint64() ) {
      throw ServiceError("/rerank: index is not an integer");
    }
    if ( i >= n ) {
      throw ServiceError("/rerank: index out of range");
    }

    const double s = score->to_number<double>();
    if ( !std::isfinite(s) ) {
      throw ServiceError("/rerank: score is not finite");
    }
    scores[i] = s;
    filled[i] = true;
  }

  for (bool f : filled) {
    if ( !f ) {
      throw ServiceError("/rerank: reply does not score every text");
    }
  }
  return scores;
}

OllamaAssist::OllamaAssist(ServiceConfig cfg)
  : cfg_(std::move(cfg)), base_(htc::parse_url(cfg_.endpoint))
{
  available_ = ping_("assist", base_, "/api/tags", cfg_);
}

std::string
OllamaAssist::complete(const std::string& prompt)
{
  json::object options;
  options["temperature"] = 0.0;
  options["top_p"]       = 1.0;
  options["seed"]        = 42;

  json::object body;
  body["model"]   = cfg_.model;
  body["prompt"]  = prompt;
  body["stream"]  = false;
  body["format"]  = "json";
  body["options"] = std::move(options);

  auto reply = post_json_(base_, "/api/generate", body, cfg_);
  const auto* text = reply.is_object() ? reply.as_object().if_contains("response") : nullptr;
  if ( !text || !text->is_string() ) {
    throw ServiceError("/api/generate: reply carries no response");
  }
  return std::string(text->as_string().c_str());
}

std::unique_ptr<EmbeddingService>
make_embedding(const ServiceConfig& cfg)
{
  if ( !cfg.enabled ) {
    return nullptr;
  }
  return std::make_unique<OllamaEmbedding>(cfg);
}

std::unique_ptr<RerankService>
make_rerank(const ServiceConfig& cfg)
{
  if ( !cfg.enabled ) {
    return nullptr;
  }
  return std::make_unique<TeiRerank>(cfg);
}

std::unique_ptr<AssistService>
make_assist(const ServiceConfig& cfg)
{
  if ( !cfg.enabled ) {
    return nullptr;
  }
  return std::make_unique<OllamaAssist>(cfg);
}

std::string
strip_json_reply(std::string_view reply)
{
  // ```json ... ``` fences first, then the outermost braces
  if ( auto fence = reply.find("```"); fence != std::string_view::npos ) {
    auto body_start = reply.find('\n', fence);
    auto close = body_start == std::string_view::npos ? std::string_view::npos
                                                      : reply.find("```", body_start);
    if ( close != std::string_view::npos ) {
      reply = reply.substr(body_start + 1, close - body_start - 1);
    }
  }

  const auto open = reply.find('{');
  const auto end  = reply.rfind('}');
  if ( open == std::string_view::npos || end == std::string_view::npos || end < open ) {
    return {};
  }
  return std::string(reply.substr(open, end - open + 1));
}

}
