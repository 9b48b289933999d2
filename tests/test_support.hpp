/*
 * test_support.hpp  Andrew Belles  Nov 29th, 2025
 *
 * Minimal assertion harness and in-process fakes shared by the test
 * executables. A failed expectation ends the process with status 1
 *
 */

#ifndef __CTXPIPE_TEST_SUPPORT_HPP
#define __CTXPIPE_TEST_SUPPORT_HPP

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "ctxpipe/crawler/fetch.hpp"
#include "ctxpipe/logging.hpp"
#include "ctxpipe/services/services.hpp"

namespace tst {

inline int g_tests_run = 0;

inline void
expect(bool condition, const std::string& message)
{
  if ( !condition ) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

inline void
run_test(const std::string& name, void (*fn)())
{
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
}

template <class E, class Fn>
bool
throws_as(Fn&& fn)
{
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

inline void
quiet_logs()
{
  lgr::init(lgr::LogConfig{"off", ""});
}

inline int
finish(const char* suite)
{
  std::cout << "\n" << suite << ": " << g_tests_run << " test(s) passed\n";
  return 0;
}

// Padding so pages clear the default minimum content length
inline std::string
filler(size_t n = 160)
{
  std::string out;
  while ( out.size() < n ) {
    out += " Additional program details are published on this page.";
  }
  return out;
}

/************ FakeSite ************************************/
/* url -> page table standing in for the network. Records every fetch so
 * tests can check what was and was not requested
 */
class FakeSite {
public:
  void page(const std::string& url, const std::string& title, const std::string& text,
            std::vector<std::string> links = {})
  {
    crwl::FetchResult r{};
    r.status    = 200;
    r.final_url = url;
    r.title     = title;
    r.text      = text;
    r.raw       = "<html><title>" + title + "</title><body>" + text + "</body></html>";
    r.links     = std::move(links);
    std::lock_guard<std::mutex> lock(mu_);
    pages_[url] = std::move(r);
  }

  void redirect(const std::string& from, const std::string& to)
  {
    std::lock_guard<std::mutex> lock(mu_);
    redirects_[from] = to;
  }

  void fail(const std::string& url, crwl::FetchErrc code)
  {
    std::lock_guard<std::mutex> lock(mu_);
    failures_[url] = code;
  }

  crwl::FetchResult fetch(const std::string& url)
  {
    std::lock_guard<std::mutex> lock(mu_);
    requested_.push_back(url);

    if ( auto f = failures_.find(url); f != failures_.end() ) {
      throw crwl::FetchError(f->second, url, "scripted failure");
    }

    std::string target = url;
    if ( auto r = redirects_.find(url); r != redirects_.end() ) {
      target = r->second;
    }

    auto it = pages_.find(target);
    if ( it == pages_.end() ) {
      throw crwl::FetchError(crwl::FetchErrc::NotFound, url, "HTTP 404");
    }
    return it->second;
  }

  std::vector<std::string> requested() const
  {
    std::lock_guard<std::mutex> lock(mu_);
    return requested_;
  }

  size_t count(const std::string& url) const
  {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& u : requested_) {
      if ( u == url ) {
        n++;
      }
    }
    return n;
  }

private:
  mutable std::mutex mu_;
  std::map<std::string, crwl::FetchResult> pages_;
  std::map<std::string, std::string> redirects_;
  std::map<std::string, crwl::FetchErrc> failures_;
  std::vector<std::string> requested_;
};

class FakeFetcher final : public crwl::FetchStrategy {
public:
  explicit FakeFetcher(FakeSite& site, std::function<void(const std::string&)> on_fetch = {})
    : site_(site), on_fetch_(std::move(on_fetch)) {}

  crwl::FetchResult fetch(const std::string& url, millis) override
  {
    if ( on_fetch_ ) {
      on_fetch_(url);
    }
    return site_.fetch(url);
  }

  std::string_view name() const noexcept override { return "fake"; }

private:
  FakeSite& site_;
  std::function<void(const std::string&)> on_fetch_;
};

/************ service fakes *******************************/

// Bag of words over a fixed vocabulary, enough for cosine to order things
class FakeEmbedding final : public svc::EmbeddingService {
public:
  explicit FakeEmbedding(std::vector<std::string> vocab, bool fail_query = false)
    : vocab_(std::move(vocab)), fail_query_(fail_query) {}

  bool available() const noexcept override { return true; }

  std::vector<float> embed(const std::string& text) override
  {
    calls++;
    if ( fail_query_ && calls == 1 ) {
      throw svc::ServiceError("embedding endpoint down");
    }

    std::string lowered;
    for (char c : text) {
      lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    std::vector<float> v(vocab_.size() + 1, 0.0f);
    v.back() = 0.01f;
    for (size_t i{0}; i < vocab_.size(); i++) {
      if ( lowered.find(vocab_[i]) != std::string::npos ) {
        v[i] = 1.0f;
      }
    }
    return v;
  }

  std::atomic<size_t> calls{0};

private:
  std::vector<std::string> vocab_;
  bool fail_query_;
};

class FakeRerank final : public svc::RerankService {
public:
  enum class Failure { None, Service, Other };

  explicit FakeRerank(bool fail = false) : fail_(fail ? Failure::Service : Failure::None) {}
  explicit FakeRerank(Failure how) : fail_(how) {}

  bool available() const noexcept override { return true; }

  // Reverses the incoming order so the effect of the tier is visible
  std::vector<double> rerank(const std::string&, const std::vector<std::string>& texts) override
  {
    seen = texts.size();
    if ( fail_ == Failure::Service ) {
      throw svc::ServiceError("rerank endpoint down");
    }
    if ( fail_ == Failure::Other ) {
      throw std::out_of_range("reply decoding failed");
    }
    std::vector<double> scores;
    for (size_t i{0}; i < texts.size(); i++) {
      scores.push_back(static_cast<double>(i + 1));
    }
    return scores;
  }

  size_t seen{0};

private:
  Failure fail_;
};

class FakeAssist final : public svc::AssistService {
public:
  explicit FakeAssist(std::string reply) : reply_(std::move(reply)) {}

  bool available() const noexcept override { return true; }

  std::string complete(const std::string& prompt) override
  {
    last_prompt = prompt;
    return reply_;
  }

  std::string last_prompt;

private:
  std::string reply_;
};

class DownService final : public svc::EmbeddingService {
public:
  bool available() const noexcept override { return false; }
  std::vector<float> embed(const std::string&) override
  {
    throw svc::ServiceError("not available");
  }
};

}

#endif // !__CTXPIPE_TEST_SUPPORT_HPP
