/*
 * http.hpp  Andrew Belles  Nov 7th, 2025
 *
 * Provides Interface for exposed http helper functions for the Crawler, the
 * fetch strategies and the service clients. Transport only: status codes are
 * handed back to the caller, redirects are not followed here
 *
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace htc {

/************ Url *****************************************/
/* Split form of an absolute http(s) url. target keeps path + query, the
 * fragment is never kept
 */
struct Url {
  std::string scheme, host, port, target;

  std::string str() const;
};

enum class Method : uint8_t {
  Get,
  Post
};

struct Request {
  Method method{Method::Get};
  std::string user_agent{"ctxpipe/1.0"};
  std::string accept{"text/html,application/xhtml+xml;q=0.9,*/*;q=0.8"};
  std::string content_type{};          // only sent with a body
  std::string body{};
  std::string api_key{};               // Authorization header value, Bearer implied
  std::chrono::milliseconds timeout{10000};
  size_t max_body_bytes{8 * 1024 * 1024};
};

struct Response {
  unsigned status{0};
  std::string body;
  std::string content_type;
  std::string location;                // empty unless the server sent one
};

/************ TimeoutError ********************************/
/* Raised when any phase of a single exchange outlives Request::timeout
 */
class TimeoutError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/************ parse_url() *********************************/
/* Splits an absolute url into its parts. Host is lowercased, the default
 * port for the scheme is filled in.
 *
 * Throws:
 *   invalid_argument for urls without scheme/host or a non http(s) scheme
 */
Url parse_url(std::string_view url);

/************ request() ***********************************/
/* Performs one exchange against url. Returns whatever status the server
 * answered with.
 *
 * Throws:
 *   TimeoutError on deadline expiry
 *   boost::system::system_error / runtime_error for transport failures
 */
Response request(const Url& url, const Request& req);

bool is_redirect(unsigned status) noexcept;
bool is_retryable(unsigned status) noexcept;

/************ url helpers *********************************/

// Absolute form of a Location header relative to the url that produced it
std::string handle_redirect(const Url& url, std::string_view loc);

// Resolves href against base. Returns "" for non http(s) targets
// (mailto:, javascript:, tel:, data:)
std::string resolve_url(std::string_view base, std::string_view href);

// Canonical key for dedup: lowercase scheme/host, default port dropped,
// dot segments removed, fragment dropped, trailing slash trimmed.
// Throws invalid_argument like parse_url
std::string normalize_url(std::string_view url);

// scheme://host[:port] of a normalized url
std::string origin(std::string_view url);
bool same_origin(std::string_view a, std::string_view b);

// Path component (no query) of an absolute url, "/" when absent
std::string url_path(std::string_view url);

// RFC 3986 query component encoding, unreserved characters kept
std::string percent_encode(std::string_view s);

}
