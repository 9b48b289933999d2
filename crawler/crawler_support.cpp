/*
 * crawler_support.cpp  Andrew Belles  Nov 18th, 2025
 *
 * Detached helpers for the Frontier: exclusion matching, keyword relevance
 * and the string forms of the crawl enums
 *
 */

#include "ctxpipe/crawler/crawler_support.hpp"
#include "ctxpipe/crawler/http.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace {

static bool
has_glob_(std::string_view pattern) noexcept
{
  return pattern.find_first_of("*?[") != std::string_view::npos;
}

static size_t
count_hits_(const std::string& haystack, const std::vector<std::string>& keywords)
{
  size_t hits = 0;
  for (const auto& kw : keywords) {
    const auto needle = crwl::to_lower(kw);
    if ( needle.empty() ) {
      continue;
    }
    if ( haystack.find(needle) != std::string::npos ) {
      hits++;
    }
  }
  return hits;
}

}

namespace crwl {

std::string
to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

/************ is_excluded() *******************************/
/* Caller Provides:
 *   absolute url and the topic's exclusion patterns
 *
 * We return:
 *   true if any pattern matches. Glob patterns ("*.pdf", "/login*") are
 *   matched against the url path with fnmatch, anything else is a case
 *   insensitive substring test on the whole url
 */
bool
is_excluded(const std::string& url, const std::vector<std::string>& patterns)
{
  if ( patterns.empty() ) {
    return false;
  }

  const std::string lowered = to_lower(url);
  std::string path;
  try {
    path = htc::url_path(url);
  } catch (const std::invalid_argument&) {
    path = url;
  }
  const std::string lowered_path = to_lower(path);

  for (const auto& pattern : patterns) {
    if ( pattern.empty() ) {
      continue;
    }
    const std::string p = to_lower(pattern);
    if ( has_glob_(p) ) {
      if ( ::fnmatch(p.c_str(), lowered_path.c_str(), 0) == 0 ||
           ::fnmatch(p.c_str(), lowered.c_str(), 0) == 0 ) {
        return true;
      }
    } else if ( lowered.find(p) != std::string::npos ) {
      return true;
    }
  }
  return false;
}

Relevance
assess_relevance(std::string_view title, std::string_view text, const CrawlPolicy& policy)
{
  std::string haystack = to_lower(title);
  haystack.push_back('\n');
  haystack += to_lower(text);

  Relevance rel{};
  rel.required_hits = count_hits_(haystack, policy.required_keywords);
  rel.optional_hits = count_hits_(haystack, policy.optional_keywords);
  rel.accepted      = rel.required_hits > 0;
  return rel;
}

std::optional<StrategyKind>
parse_strategy(std::string_view name) noexcept
{
  if ( name == "lightweight" || name == "light" ) {
    return StrategyKind::Lightweight;
  }
  if ( name == "rendering" || name == "render" ) {
    return StrategyKind::Rendering;
  }
  return std::nullopt;
}

std::string_view
to_string(StrategyKind kind) noexcept
{
  return kind == StrategyKind::Rendering ? "rendering" : "lightweight";
}

std::optional<RateLimitScope>
parse_scope(std::string_view name) noexcept
{
  if ( name == "process" ) {
    return RateLimitScope::Process;
  }
  if ( name == "domain" ) {
    return RateLimitScope::Domain;
  }
  return std::nullopt;
}

}
