/*
 * crawler_support.hpp  Andrew Belles Nov 7th, 2025
 *
 * Defines the structures and detached helper functions that the
 * Frontier and Runner require
 *
 */

#ifndef __CTXPIPE_CRAWLER_SUPPORT_HPP
#define __CTXPIPE_CRAWLER_SUPPORT_HPP


#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using millis = std::chrono::milliseconds;

/************ supporting structures ***********************/

namespace crwl {

enum class StrategyKind : uint8_t {
  Lightweight,
  Rendering
};

enum class RateLimitScope : uint8_t {
  Process,                          // one clock for every fetch through the limiter
  Domain                            // one clock per host
};

struct FetchConfig {
  std::string user_agent{"ctxpipe/1.0 (+context crawler)"};
  size_t max_redirects{5};
  size_t max_body_bytes{8 * 1024 * 1024};
  std::string render_endpoint{"http://localhost:3000"};  // browserless style service
  std::string render_token{};
  std::string render_wait_until{"networkidle2"};
  millis render_settle{500};        // extra wait after the load event
};

struct CrawlPolicy {
  size_t max_depth{2};
  size_t max_docs_per_topic{50};    // accepted documents, 0 = unbounded
  std::vector<std::string> required_keywords{  // OR gate, an empty set accepts nothing
    "visa", "immigration", "permit", "residence", "eligibility",
    "requirements", "application", "skilled", "worker", "student"};
  std::vector<std::string> optional_keywords;  // boost only
  std::vector<std::string> exclude_patterns;   // glob on path, or substring on url
  StrategyKind fetch_strategy{StrategyKind::Lightweight};
  size_t min_content_chars{100};
  millis fetch_timeout{15000};
};

struct Seed {
  std::string url;
  std::string topic;
};

struct TopicSeed {
  std::string topic;
  std::vector<std::string> seed_urls;
  CrawlPolicy policy;
};

struct TopicSummary {
  std::string topic;
  size_t fetched{0};
  size_t accepted{0};
  size_t rejected{0};
  size_t errored{0};
};

struct CrawlSummary {
  std::vector<TopicSummary> topics;

  const TopicSummary*
  find(std::string_view topic) const noexcept
  {
    for (const auto& t : topics) {
      if ( t.topic == topic ) {
        return &t;
      }
    }
    return nullptr;
  }

  TopicSummary&
  at(const std::string& topic)
  {
    for (auto& t : topics) {
      if ( t.topic == topic ) {
        return t;
      }
    }
    topics.push_back(TopicSummary{topic});
    return topics.back();
  }
};

struct Relevance {
  size_t required_hits{0};
  size_t optional_hits{0};
  bool accepted{false};

  double score() const noexcept
  {
    return static_cast<double>(required_hits) + 0.5 * static_cast<double>(optional_hits);
  }
};

/************ RateLimiter *********************************/
/* Fixed minimum delay between fetches. Internally synchronized so one
 * instance may be handed to several Frontiers when a shared budget is
 * configured, by default every Frontier owns its own
 */
class RateLimiter {
public:
  explicit RateLimiter(millis min_delay, RateLimitScope scope = RateLimitScope::Process)
    : delay_(min_delay), scope_(scope) {}

  /********** acquire() ***********************************/
  /* Blocks until a fetch against host may start and books the slot.
   *
   * We return:
   *   false if token was triggered while waiting, no slot is booked then
   */
  bool acquire(const std::string& host, std::stop_token token = {})
  {
    const std::string key = scope_ == RateLimitScope::Domain ? host : std::string{};
    std::unique_lock<std::mutex> lock(mu_);
    while ( true ) {
      if ( token.stop_requested() ) {
        return false;
      }

      const auto now = clock::now();
      auto it = last_.find(key);
      if ( it == last_.end() || now >= it->second + delay_ ) {
        last_[key] = now;
        return true;
      }

      const auto next = it->second + delay_;
      cv_.wait_until(lock, token, next, [] { return false; });
    }
  }

  millis delay() const noexcept { return delay_; }
  RateLimitScope scope() const noexcept { return scope_; }

private:
  using clock = std::chrono::steady_clock;

  millis delay_;
  RateLimitScope scope_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::unordered_map<std::string, clock::time_point> last_;
};

/************ detached helpers ****************************/

std::string to_lower(std::string_view s);

// True when url hits any exclusion pattern. Patterns holding glob
// metacharacters match the url path, plain ones are substrings of the url
bool is_excluded(const std::string& url, const std::vector<std::string>& patterns);

// Keyword hits over lowercased title + text
Relevance assess_relevance(std::string_view title, std::string_view text,
                           const CrawlPolicy& policy);

std::optional<StrategyKind> parse_strategy(std::string_view name) noexcept;
std::string_view to_string(StrategyKind kind) noexcept;

std::optional<RateLimitScope> parse_scope(std::string_view name) noexcept;

} // end namespace crwl

#endif // !__CTXPIPE_CRAWLER_SUPPORT_HPP
