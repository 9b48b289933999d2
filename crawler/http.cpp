/*
 * http.cpp  Andrew Belles  Nov 7th, 2025
 *
 * Beast/Asio transport behind htc::request plus the url plumbing the
 * frontier relies on for dedup and same-origin checks
 *
 */

#include "ctxpipe/crawler/http.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <vector>

namespace {

namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;

static std::string
lower_(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

static inline std::string
auth(const std::string& key)
{
  static const std::string bearer = "Bearer ";
  if ( key.rfind(bearer, 0) == 0 ) {
    return key;
  } else {
    return bearer + key;
  }
}

/************ run_op_() ***********************************/
/* Drives a single async operation to completion on ioc. Async ops are used
 * so tcp_stream deadlines actually apply, the sync overloads ignore them
 *
 * Throws:
 *   TimeoutError when the stream deadline fired
 *   system_error for anything else
 */
template <class Initiate>
void
run_op_(asio::io_context& ioc, Initiate&& initiate, const char* phase)
{
  beast::error_code ec;
  initiate([&ec](beast::error_code e, auto&&...) { ec = e; });
  ioc.restart();
  ioc.run();

  if ( ec == beast::error::timeout ) {
    throw htc::TimeoutError(std::string("htc::request: timed out during ") + phase);
  }
  if ( ec ) {
    throw beast::system_error(ec);
  }
}

http::request<http::string_body>
build_request(const htc::Url& url, const htc::Request& opts)
{
  const auto verb = opts.method == htc::Method::Post ? http::verb::post : http::verb::get;
  http::request<http::string_body> req{verb, url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, opts.user_agent);

  if ( !opts.api_key.empty() ) {
    req.set(http::field::authorization, auth(opts.api_key));
  }

  req.set(http::field::accept, opts.accept);
  req.set(http::field::connection, "close");

  if ( opts.method == htc::Method::Post ) {
    req.set(http::field::content_type,
            opts.content_type.empty() ? "application/json" : opts.content_type);
    req.body() = opts.body;
    req.prepare_payload();
  }
  return req;
}

htc::Response
to_response_(http::response<http::string_body>&& res)
{
  htc::Response out{};
  out.status = res.result_int();
  if ( auto it = res.find(http::field::content_type); it != res.end() ) {
    out.content_type = std::string(it->value());
  }
  if ( auto it = res.find(http::field::location); it != res.end() ) {
    out.location = std::string(it->value());
  }
  out.body = std::move(res.body());
  return out;
}

template <class Stream>
htc::Response
exchange_(Stream& stream, asio::io_context& ioc, const htc::Url& url,
          const htc::Request& opts)
{
  auto req = build_request(url, opts);

  beast::get_lowest_layer(stream).expires_after(opts.timeout);
  run_op_(ioc, [&](auto handler) { http::async_write(stream, req, handler); }, "write");

  beast::flat_buffer bufr;
  http::response_parser<http::string_body> parser;
  parser.body_limit(opts.max_body_bytes);

  beast::get_lowest_layer(stream).expires_after(opts.timeout);
  run_op_(ioc, [&](auto handler) { http::async_read(stream, bufr, parser, handler); }, "read");

  return to_response_(parser.release());
}

static htc::Response
https_request_(const htc::Url& url, const htc::Request& opts, asio::io_context& ioc)
{
  asio::ip::tcp::resolver resolver{ioc};
  const auto results = resolver.resolve(url.host, url.port);

  ssl::context ctx{ssl::context::tls_client};
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);
  beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

  // throw error on failure to setup SNI for SSL prior to TLS handshake
  if ( !SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()) ) {
    throw beast::system_error(
      beast::error_code(
        static_cast<int>(::ERR_get_error()),
        asio::error::get_ssl_category()
      )
    );
  }

  beast::get_lowest_layer(stream).expires_after(opts.timeout);
  run_op_(ioc, [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(results, handler);
  }, "connect");

  beast::get_lowest_layer(stream).expires_after(opts.timeout);
  run_op_(ioc, [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, handler);
  }, "handshake");

  auto res = exchange_(stream, ioc, url, opts);

  // skip the TLS close_notify round trip, peers routinely truncate anyway
  beast::error_code err;
  beast::get_lowest_layer(stream).socket().shutdown(asio::ip::tcp::socket::shutdown_both, err);
  return res;
}

static htc::Response
http_request_(const htc::Url& url, const htc::Request& opts, asio::io_context& ioc)
{
  asio::ip::tcp::resolver resolver{ioc};
  const auto results = resolver.resolve(url.host, url.port);

  beast::tcp_stream stream{ioc};
  stream.expires_after(opts.timeout);
  run_op_(ioc, [&](auto handler) { stream.async_connect(results, handler); }, "connect");

  auto res = exchange_(stream, ioc, url, opts);

  beast::error_code err;
  stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, err);
  return res;
}

/************ remove_dot_segments_() **********************/
/* Collapses "." and ".." in a path, keeps a trailing slash
 */
static std::string
remove_dot_segments_(std::string_view path)
{
  std::vector<std::string_view> segments;
  size_t pos = 0;
  while ( pos <= path.size() ) {
    size_t next = path.find('/', pos);
    if ( next == std::string_view::npos ) {
      next = path.size();
    }

    auto segment = path.substr(pos, next - pos);
    if ( segment == ".." ) {
      if ( !segments.empty() ) {
        segments.pop_back();
      }
    } else if ( segment != "." && !segment.empty() ) {
      segments.push_back(segment);
    }
    pos = next + 1;
  }

  std::string out = "/";
  for (size_t i = 0; i < segments.size(); i++) {
    out.append(segments[i]);
    if ( i + 1 < segments.size() ) {
      out.push_back('/');
    }
  }

  const bool trailing = path.size() > 1 && path.back() == '/';
  if ( trailing && out.back() != '/' ) {
    out.push_back('/');
  }
  return out;
}

static std::string
default_port_(std::string_view scheme)
{
  return scheme == "https" ? "443" : "80";
}

}

/************ http for crawler ****************************/
namespace htc {

std::string
Url::str() const
{
  std::string out = scheme + "://" + host;
  if ( port != default_port_(scheme) ) {
    out += ":" + port;
  }
  out += target.empty() ? "/" : target;
  return out;
}

Url
parse_url(std::string_view url)
{
  // lambda helper to throw exception on parse failure
  auto bad = [&url]{
    throw std::invalid_argument("invalid URL: " + std::string(url));
  };

  const auto scheme_position = url.find("://");
  if ( scheme_position == std::string_view::npos ) {
    bad();
  }

  Url res{};
  res.scheme = lower_(url.substr(0, scheme_position));
  if ( res.scheme != "http" && res.scheme != "https" ) {
    bad();
  }

  auto trunc = url.substr(scheme_position + 3);
  if ( auto hash = trunc.find('#'); hash != std::string_view::npos ) {
    trunc = trunc.substr(0, hash);
  }

  auto slash_position = trunc.find_first_of("/?");
  bool slash_last = slash_position == std::string_view::npos;
  std::string_view host_port = slash_last? trunc : trunc.substr(0, slash_position);
  res.target = slash_last? "/" : std::string(trunc.substr(slash_position));
  if ( res.target.front() == '?' ) {
    res.target.insert(res.target.begin(), '/');
  }

  if ( auto at = host_port.rfind('@'); at != std::string_view::npos ) {
    host_port = host_port.substr(at + 1);
  }

  auto colon_position = host_port.find(':');
  if ( colon_position == std::string_view::npos ) {
    res.host = lower_(host_port);
    res.port = default_port_(res.scheme);
  } else {
    res.host = lower_(host_port.substr(0, colon_position));
    res.port = std::string(host_port.substr(colon_position + 1));
    if ( res.port.empty() ) {
      res.port = default_port_(res.scheme);
    }
  }

  if ( res.host.empty() ) {
    bad();
  }
  return res;
}

bool
is_redirect(unsigned status) noexcept
{
  return status == 301 || status == 302 || status == 303 ||
         status == 307 || status == 308;
}

bool
is_retryable(unsigned status) noexcept
{
  return status == 429 || (status >= 500 && status <= 599);
}

std::string
handle_redirect(const Url& url, std::string_view loc)
{
  return resolve_url(url.str(), loc);
}

Response
request(const Url& url, const Request& req)
{
  asio::io_context ioc;
  if ( url.scheme == "https" ) {
    return https_request_(url, req, ioc);
  } else if ( url.scheme == "http" ) {
    return http_request_(url, req, ioc);
  }
  throw std::invalid_argument("Url was malformed, choked on invalid scheme");
}

std::string
resolve_url(std::string_view base, std::string_view href)
{
  // trim surrounding whitespace, browsers tolerate it in href values
  while ( !href.empty() && std::isspace(static_cast<unsigned char>(href.front())) ) {
    href.remove_prefix(1);
  }
  while ( !href.empty() && std::isspace(static_cast<unsigned char>(href.back())) ) {
    href.remove_suffix(1);
  }

  if ( href.empty() || href.front() == '#' ) {
    return std::string(base);
  }

  const std::string lowered = lower_(href.substr(0, std::min<size_t>(href.size(), 12)));
  if ( lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0 ) {
    return std::string(href);
  }

  // any other scheme is not crawlable
  const auto colon = href.find(':');
  const auto first_sep = href.find_first_of("/?#");
  if ( colon != std::string_view::npos &&
       (first_sep == std::string_view::npos || colon < first_sep) ) {
    return "";
  }

  const Url b = parse_url(base);
  const std::string root = b.scheme + "://" + b.host +
    (b.port != default_port_(b.scheme) ? ":" + b.port : "");

  if ( href.rfind("//", 0) == 0 ) {
    return b.scheme + ":" + std::string(href);
  }

  if ( href.front() == '/' ) {
    return root + std::string(href);
  }

  const std::string base_path = b.target.substr(0, b.target.find('?'));
  if ( href.front() == '?' ) {
    return root + base_path + std::string(href);
  }

  auto path_end = base_path.rfind('/');
  bool is_end = path_end == std::string::npos;
  std::string dir = is_end? "/" : base_path.substr(0, path_end + 1);
  return root + dir + std::string(href);
}

std::string
normalize_url(std::string_view url)
{
  Url u = parse_url(url);

  std::string path = u.target;
  std::string query;
  if ( auto q = path.find('?'); q != std::string::npos ) {
    query = path.substr(q);
    path.erase(q);
    if ( query == "?" ) {
      query.clear();
    }
  }

  path = remove_dot_segments_(path);
  if ( path.size() > 1 && path.back() == '/' ) {
    path.pop_back();
  }

  u.target = path + query;
  return u.str();
}

std::string
origin(std::string_view url)
{
  const Url u = parse_url(url);
  std::string out = u.scheme + "://" + u.host;
  if ( u.port != default_port_(u.scheme) ) {
    out += ":" + u.port;
  }
  return out;
}

bool
same_origin(std::string_view a, std::string_view b)
{
  try {
    return origin(a) == origin(b);
  } catch (const std::invalid_argument&) {
    return false;
  }
}

std::string
url_path(std::string_view url)
{
  const Url u = parse_url(url);
  return u.target.substr(0, u.target.find('?'));
}

std::string
percent_encode(std::string_view s)
{
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if ( std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

}
