/*
 * fetch.hpp  Andrew Belles  Nov 18th, 2025
 *
 * Fetch strategies. The Frontier only ever sees FetchStrategy, which one
 * is behind it is decided by configuration through make_fetcher()
 *
 */

#ifndef __CTXPIPE_FETCH_HPP
#define __CTXPIPE_FETCH_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "crawler_support.hpp"
#include "http.hpp"

namespace crwl {

/************ FetchError **********************************/
/* Typed per-url failure. Never fatal for a crawl run
 */
enum class FetchErrc : uint8_t {
  Timeout,
  Blocked,
  NotFound,
  Other
};

std::string_view to_string(FetchErrc code) noexcept;

class FetchError : public std::runtime_error {
public:
  FetchError(FetchErrc code, std::string url, const std::string& detail);

  FetchErrc code() const noexcept { return code_; }
  const std::string& url() const noexcept { return url_; }

private:
  FetchErrc code_;
  std::string url_;
};

struct FetchResult {
  unsigned status{0};
  std::string final_url;            // after redirects, normalized
  std::string title;
  std::string text;                 // visible text
  std::string raw;                  // markup as received / rendered
  std::vector<std::string> links;   // absolute, normalized
};

/************ FetchStrategy *******************************/
/* Capability interface shared by all fetchers.
 *
 * Throws:
 *   FetchError for every failure, whatever its cause
 */
class FetchStrategy {
public:
  virtual ~FetchStrategy() = default;

  virtual FetchResult fetch(const std::string& url, millis timeout) = 0;
  virtual std::string_view name() const noexcept = 0;
};

/************ LightweightFetcher **************************/
/* Plain GET with an identifying User-Agent. Follows redirects itself so
 * the final url can be reported
 */
class LightweightFetcher final : public FetchStrategy {
public:
  explicit LightweightFetcher(FetchConfig cfg) : cfg_(std::move(cfg)) {}

  FetchResult fetch(const std::string& url, millis timeout) override;
  std::string_view name() const noexcept override { return "lightweight"; }

private:
  FetchConfig cfg_;
};

/************ RenderingFetcher ****************************/
/* Hands the page load to a headless browser service (browserless style
 * /content endpoint) and parses the rendered markup it returns
 */
class RenderingFetcher final : public FetchStrategy {
public:
  explicit RenderingFetcher(FetchConfig cfg);

  FetchResult fetch(const std::string& url, millis timeout) override;
  std::string_view name() const noexcept override { return "rendering"; }

  // JSON body posted to the render service, exposed for tests
  std::string build_payload(const std::string& url, millis timeout) const;

  // The /content endpoint, token included
  const htc::Url& endpoint() const noexcept { return endpoint_; }

private:
  FetchConfig cfg_;
  htc::Url endpoint_;
};

// Maps a non-success status onto the error taxonomy
FetchErrc classify_status(unsigned status, std::string_view body) noexcept;

// Builds the page from markup, shared by both strategies
FetchResult build_result(const std::string& final_url, unsigned status, std::string raw);

std::unique_ptr<FetchStrategy> make_fetcher(StrategyKind kind, const FetchConfig& cfg);

} // end namespace crwl

#endif // !__CTXPIPE_FETCH_HPP
