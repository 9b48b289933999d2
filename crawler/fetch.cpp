/*
 * fetch.cpp  Andrew Belles  Nov 18th, 2025
 *
 * Lightweight and rendering fetch strategies
 *
 */

#include "ctxpipe/crawler/fetch.hpp"
#include "ctxpipe/crawler/html.hpp"
#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/logging.hpp"

#include <boost/json.hpp>

#include <exception>

namespace {

static bool
contains_ci_(std::string_view haystack, std::string_view needle)
{
  return crwl::to_lower(haystack).find(needle) != std::string::npos;
}

static bool
is_textual_(const std::string& content_type)
{
  if ( content_type.empty() ) {
    return true;
  }
  const auto lowered = crwl::to_lower(content_type);
  return lowered.find("html") != std::string::npos ||
         lowered.find("text/") != std::string::npos ||
         lowered.find("xml") != std::string::npos;
}

/************ exchange_() *********************************/
/* Runs one htc::request and translates transport failures into the
 * FetchError taxonomy
 */
static htc::Response
exchange_(const std::string& url, const htc::Request& req)
{
  try {
    return htc::request(htc::parse_url(url), req);
  } catch (const htc::TimeoutError& e) {
    throw crwl::FetchError(crwl::FetchErrc::Timeout, url, e.what());
  } catch (const std::exception& e) {
    throw crwl::FetchError(crwl::FetchErrc::Other, url, e.what());
  }
}

}

namespace crwl {

std::string_view
to_string(FetchErrc code) noexcept
{
  switch ( code ) {
    case FetchErrc::Timeout:  return "timeout";
    case FetchErrc::Blocked:  return "blocked";
    case FetchErrc::NotFound: return "notFound";
    case FetchErrc::Other:    return "other";
  }
  return "other";
}

FetchError::FetchError(FetchErrc code, std::string url, const std::string& detail)
  : std::runtime_error(std::string(to_string(code)) + ": " + url + ": " + detail),
    code_(code), url_(std::move(url)) {}

FetchErrc
classify_status(unsigned status, std::string_view body) noexcept
{
  if ( status == 401 || status == 403 || status == 429 ) {
    return FetchErrc::Blocked;
  }
  if ( status == 404 || status == 410 ) {
    return FetchErrc::NotFound;
  }
  if ( status == 408 || status == 504 ) {
    return FetchErrc::Timeout;
  }
  if ( status == 503 ) {
    // anti-bot interstitials like to answer 503 with a challenge page
    const auto head = body.substr(0, 4096);
    if ( contains_ci_(head, "captcha") || contains_ci_(head, "cloudflare") ||
         contains_ci_(head, "access denied") ) {
      return FetchErrc::Blocked;
    }
  }
  return FetchErrc::Other;
}

FetchResult
build_result(const std::string& final_url, unsigned status, std::string raw)
{
  auto page = htm::parse_html(raw, final_url);

  FetchResult out{};
  out.status    = status;
  out.final_url = final_url;
  out.title     = std::move(page.title);
  out.text      = std::move(page.text);
  out.links     = std::move(page.links);
  out.raw       = std::move(raw);
  return out;
}

/************ LightweightFetcher::fetch *******************/
/* GET with redirects followed up to max_redirects hops
 */
FetchResult
LightweightFetcher::fetch(const std::string& url, millis timeout)
{
  htc::Request req{};
  req.user_agent     = cfg_.user_agent;
  req.timeout        = timeout;
  req.max_body_bytes = cfg_.max_body_bytes;

  std::string current = url;
  for (size_t hop{0}; hop <= cfg_.max_redirects; hop++) {
    auto res = exchange_(current, req);

    // implies a redirect
    if ( htc::is_redirect(res.status) && !res.location.empty() ) {
      try {
        current = htc::normalize_url(htc::handle_redirect(htc::parse_url(current), res.location));
      } catch (const std::invalid_argument& e) {
        throw FetchError(FetchErrc::Other, url, std::string("bad redirect: ") + e.what());
      }
      continue;
    }

    if ( res.status < 200 || res.status >= 300 ) {
      throw FetchError(classify_status(res.status, res.body), current,
                       "HTTP status " + std::to_string(res.status));
    }

    if ( !is_textual_(res.content_type) ) {
      throw FetchError(FetchErrc::Other, current,
                       "unsupported content type " + res.content_type);
    }

    return build_result(current, res.status, std::move(res.body));
  }

  throw FetchError(FetchErrc::Other, url, "too many redirects");
}

RenderingFetcher::RenderingFetcher(FetchConfig cfg)
  : cfg_(std::move(cfg)), endpoint_(htc::parse_url(cfg_.render_endpoint))
{
  std::string target = endpoint_.target;
  if ( target.empty() || target.back() != '/' ) {
    target.push_back('/');
  }
  target += "content";
  if ( !cfg_.render_token.empty() ) {
    target += "?token=" + htc::percent_encode(cfg_.render_token);
  }
  endpoint_.target = std::move(target);
}

std::string
RenderingFetcher::build_payload(const std::string& url, millis timeout) const
{
  boost::json::object goto_options;
  goto_options["waitUntil"] = cfg_.render_wait_until;
  goto_options["timeout"]   = timeout.count();

  boost::json::object payload;
  payload["url"]            = url;
  payload["gotoOptions"]    = std::move(goto_options);
  payload["waitForTimeout"] = cfg_.render_settle.count();
  payload["setExtraHTTPHeaders"] = boost::json::object{{"User-Agent", cfg_.user_agent}};
  return boost::json::serialize(payload);
}

/************ RenderingFetcher::fetch *********************/
/* The render service loads the page in a real browser, so anti-automation
 * walls that stop the lightweight fetcher usually do not apply here. The
 * service answers with the rendered markup or an error status
 */
FetchResult
RenderingFetcher::fetch(const std::string& url, millis timeout)
{
  htc::Request req{};
  req.method         = htc::Method::Post;
  req.content_type   = "application/json";
  req.accept         = "text/html";
  req.body           = build_payload(url, timeout);
  req.user_agent     = cfg_.user_agent;
  req.max_body_bytes = cfg_.max_body_bytes;
  // page load + settle, plus headroom for the service itself
  req.timeout        = timeout + cfg_.render_settle + millis{5000};

  htc::Response res;
  try {
    res = htc::request(endpoint_, req);
  } catch (const htc::TimeoutError& e) {
    throw FetchError(FetchErrc::Timeout, url, e.what());
  } catch (const std::exception& e) {
    throw FetchError(FetchErrc::Other, url, std::string("render service: ") + e.what());
  }

  if ( res.status < 200 || res.status >= 300 ) {
    throw FetchError(classify_status(res.status, res.body), url,
                     "render service status " + std::to_string(res.status));
  }

  std::string final_url = url;
  try {
    final_url = htc::normalize_url(url);
  } catch (const std::invalid_argument&) {
  }
  return build_result(final_url, 200, std::move(res.body));
}

std::unique_ptr<FetchStrategy>
make_fetcher(StrategyKind kind, const FetchConfig& cfg)
{
  switch ( kind ) {
    case StrategyKind::Rendering:
      lgr::get("fetch")->debug("using rendering fetcher via {}", cfg.render_endpoint);
      return std::make_unique<RenderingFetcher>(cfg);
    case StrategyKind::Lightweight:
    default:
      return std::make_unique<LightweightFetcher>(cfg);
  }
}

}
