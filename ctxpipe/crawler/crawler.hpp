/*
 * crawler.hpp  Andrew Belles  Nov 6th, 2025
 *
 * Crawl Frontier and Runner. The Frontier walks one or more topics breadth
 * first through a FetchStrategy and hands every accepted page to a sink,
 * which in the pipeline writes it into the ContentStore. The Runner fans
 * independent topic crawls out over worker threads, one Frontier each
 */

#ifndef __CTXPIPE_CRAWLER_HPP
#define __CTXPIPE_CRAWLER_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "crawler_support.hpp"
#include "fetch.hpp"
#include "http.hpp"
#include "ctxpipe/logging.hpp"
#include "ctxpipe/store/model.hpp"

namespace crwl {

using DocumentSink = std::function<void(const dat::Document&)>;

/************ crwl::Frontier ******************************/
/* Bounded BFS over a set of seeds.
 *
 * Crawl state (visited set, queue, per-topic counts) lives only for the
 * duration of one crawl() call. A Frontier is not safe to share between
 * threads, the RateLimiter it holds may be.
 *
 * Sink errors are not caught here: a failing store write ends the crawl and
 * reaches the caller
 */
class Frontier {
public:
  Frontier(
    std::unique_ptr<FetchStrategy> fetcher,
    std::shared_ptr<RateLimiter> limiter,
    DocumentSink sink
  ) : fetcher_(std::move(fetcher)), limiter_(std::move(limiter)), sink_(std::move(sink))
  {
    if ( !fetcher_ ) {
      throw std::invalid_argument("crwl::Frontier requires a fetch strategy");
    }
    if ( !sink_ ) {
      throw std::invalid_argument("crwl::Frontier requires a document sink");
    }
  }

  /********** crwl::crawl() *******************************/
  /* Crawls every topic named by seeds, in order of first appearance. Each
   * topic gets its own queue seeded at depth 0 with its urls in the given
   * order, all topics share one visited set.
   *
   * Caller Provides:
   *   seeds (url, topic), the policy (depth/cap/keywords/exclusions)
   *   and an optional stop token checked between pops
   *
   * We return:
   *   one TopicSummary per topic, also for topics cut short by stop
   */
  CrawlSummary
  crawl(const std::vector<Seed>& seeds, const CrawlPolicy& policy,
        std::stop_token token = {})
  {
    std::vector<std::string> order;
    for (const auto& s : seeds) {
      if ( std::find(order.begin(), order.end(), s.topic) == order.end() ) {
        order.push_back(s.topic);
      }
    }

    visited_.clear();
    CrawlSummary summary{};
    for (const auto& topic : order) {
      auto& counts = summary.at(topic);
      if ( token.stop_requested() ) {
        continue;
      }

      std::vector<std::string> urls;
      for (const auto& s : seeds) {
        if ( s.topic == topic ) {
          urls.push_back(s.url);
        }
      }
      walk_topic_(topic, urls, policy, counts, token);
    }
    return summary;
  }

  TopicSummary
  crawl(const TopicSeed& job, std::stop_token token = {})
  {
    std::vector<Seed> seeds;
    for (const auto& url : job.seed_urls) {
      seeds.push_back(Seed{url, job.topic});
    }

    auto summary = crawl(seeds, job.policy, token);
    if ( const auto* t = summary.find(job.topic) ) {
      return *t;
    }
    return TopicSummary{job.topic};
  }

private:
  struct Pending {
    std::string url;
    size_t depth{0};
  };

  std::unique_ptr<FetchStrategy> fetcher_;
  std::shared_ptr<RateLimiter> limiter_;
  DocumentSink sink_;
  std::unordered_set<std::string> visited_{};

  /********** walk_topic_() *******************************/
  /* The per-topic BFS loop. Every popped url is marked visited before
   * anything can fail, so no url is fetched twice in a run
   */
  void
  walk_topic_(const std::string& topic, const std::vector<std::string>& seed_urls,
              const CrawlPolicy& policy, TopicSummary& counts, std::stop_token token)
  {
    auto log = lgr::get("crawler");
    std::deque<Pending> queue;
    std::unordered_set<std::string> seen;

    for (const auto& raw : seed_urls) {
      auto url = normalize_or_empty_(raw);
      if ( url.empty() ) {
        log->warn("[{}] dropping invalid seed '{}'", topic, raw);
        counts.errored++;
        continue;
      }
      if ( seen.insert(url).second ) {
        queue.push_back(Pending{std::move(url), 0});
      }
    }

    log->info("[{}] crawl start, {} seed(s), max depth {}, fetcher {}",
              topic, queue.size(), policy.max_depth, fetcher_->name());

    while ( !queue.empty() ) {
      if ( token.stop_requested() ) {
        log->info("[{}] stop requested, {} url(s) left in queue", topic, queue.size());
        break;
      }

      if ( policy.max_docs_per_topic > 0 && counts.accepted >= policy.max_docs_per_topic ) {
        log->info("[{}] document cap {} reached", topic, policy.max_docs_per_topic);
        break;
      }

      Pending next = std::move(queue.front());
      queue.pop_front();

      if ( next.depth > policy.max_depth || !visited_.insert(next.url).second ) {
        continue;
      }

      if ( is_excluded(next.url, policy.exclude_patterns) ) {
        log->info("[{}] excluded {}", topic, next.url);
        counts.rejected++;
        continue;
      }

      if ( limiter_ && !limiter_->acquire(host_of_(next.url), token) ) {
        log->info("[{}] stop requested while rate limited", topic);
        break;
      }

      FetchResult page;
      try {
        page = fetcher_->fetch(next.url, policy.fetch_timeout);
      } catch (const FetchError& e) {
        log->warn("[{}] fetch failed ({}): {}", topic, to_string(e.code()), e.what());
        counts.errored++;
        continue;
      } catch (const std::exception& e) {
        log->warn("[{}] fetch failed: {}: {}", topic, next.url, e.what());
        counts.errored++;
        continue;
      }
      counts.fetched++;

      // a redirect may land on a page that was already handled
      std::string final_url = normalize_or_empty_(page.final_url);
      if ( final_url.empty() ) {
        final_url = next.url;
      }
      if ( final_url != next.url ) {
        if ( !visited_.insert(final_url).second ) {
          log->info("[{}] rejected {}: redirected to visited {}", topic, next.url, final_url);
          counts.rejected++;
          continue;
        }
        if ( is_excluded(final_url, policy.exclude_patterns) ) {
          log->info("[{}] rejected {}: redirected to excluded {}", topic, next.url, final_url);
          counts.rejected++;
          continue;
        }
      }

      if ( page.text.size() < policy.min_content_chars ) {
        log->info("[{}] rejected {}: {} chars of text", topic, final_url, page.text.size());
        counts.rejected++;
        continue;
      }

      const Relevance rel = assess_relevance(page.title, page.text, policy);
      if ( !rel.accepted ) {
        log->info("[{}] rejected {}: no required keyword", topic, final_url);
        counts.rejected++;
        continue;
      }

      dat::Document doc{};
      doc.url          = final_url;
      doc.topic        = topic;
      doc.title        = page.title;
      doc.content_text = std::move(page.text);
      doc.content_raw  = std::move(page.raw);
      doc.links        = page.links;
      doc.depth        = next.depth;
      doc.relevance    = rel.score();
      doc.fetched_at   = dat::now_ms();

      sink_(doc);
      counts.accepted++;
      log->info("[{}] accepted {} (depth {}, relevance {:.1f})",
                topic, final_url, next.depth, rel.score());

      if ( next.depth + 1 > policy.max_depth ) {
        continue;
      }
      for (const auto& link : page.links) {
        auto url = normalize_or_empty_(link);
        if ( url.empty() || !htc::same_origin(url, final_url) ) {
          continue;
        }
        if ( visited_.count(url) || !seen.insert(url).second ) {
          continue;
        }
        queue.push_back(Pending{std::move(url), next.depth + 1});
      }
    }

    log->info("[{}] crawl done: fetched {}, accepted {}, rejected {}, errored {}",
              topic, counts.fetched, counts.accepted, counts.rejected, counts.errored);
  }

  static std::string
  normalize_or_empty_(const std::string& url)
  {
    try {
      return htc::normalize_url(url);
    } catch (const std::invalid_argument&) {
      return {};
    }
  }

  static std::string
  host_of_(const std::string& url)
  {
    try {
      return htc::parse_url(url).host;
    } catch (const std::invalid_argument&) {
      return {};
    }
  }
};

/************ crwl::Runner ********************************/
/* Worker pool over topic jobs. Every job is crawled by a fresh Frontier
 * from the factory, so crawl state never crosses topics. The factory
 * decides whether Frontiers share a RateLimiter.
 *
 * Errors escaping a job (store conflicts, a throwing factory) go to the
 * error callback and the first one is rethrown from join()
 */
class Runner {
public:
  struct Snapshot {
    size_t queued{0};
    size_t processed{0};
    size_t active{0};
    bool running{false};
    std::chrono::system_clock::time_point last_activity{};
  };

  using FrontierFactory = std::function<std::unique_ptr<Frontier>(const TopicSeed&)>;

  explicit Runner(FrontierFactory factory, size_t workers = 2, size_t max_queue = 512)
    : factory_(std::move(factory)), workers_n_(workers), max_queue_(max_queue)
  {
    if ( max_queue_ == 0 ) {
      throw std::invalid_argument("crwl::Runner max_queue must be greater than zero");
    }
    if ( workers_n_ == 0 ) {
      throw std::invalid_argument("crwl::Runner needs at least one worker");
    }
    if ( !factory_ ) {
      throw std::invalid_argument("crwl::Runner requires a frontier factory");
    }
  }

  ~Runner()
  {
    request_stop();
    for (auto& w : workers_) {
      if ( w.joinable() ) {
        w.join();
      }
    }
  }

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  void set_on_error(std::function<void(const std::exception&)> error_callback)
  {
    on_error_ = std::move(error_callback);
  }

  void start(void)
  {
    bool expected = false;
    if ( !running_.compare_exchange_strong(expected, true) ) {
      return;
    }

    closed_.store(false, std::memory_order_relaxed);
    stop_requested_.store(false, std::memory_order_relaxed);
    for (size_t i{0}; i < workers_n_; i++) {
      workers_.emplace_back([this](std::stop_token token) { worker_loop_(token); });
    }
  }

  bool enqueue(TopicSeed job)
  {
    if ( stop_requested_.load(std::memory_order_relaxed) ||
         closed_.load(std::memory_order_relaxed) ) {
      return false;
    }

    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      if ( queue_.size() >= max_queue_ ) {
        return false;
      }
      queue_.push_back(std::move(job));
    }

    gate_.release();
    return true;
  }

  /********** close() *************************************/
  /* No further jobs. Workers finish what is queued and exit
   */
  void close(void)
  {
    closed_.store(true, std::memory_order_relaxed);
    gate_.release(static_cast<std::ptrdiff_t>(workers_n_));
  }

  /********** request_stop() ******************************/
  /* Cancels: queued jobs are dropped and running crawls stop at their
   * next queue pop
   */
  void request_stop(void)
  {
    stop_requested_.store(true, std::memory_order_relaxed);
    for (auto& w : workers_) {
      if ( w.joinable() ) {
        w.request_stop();
      }
    }
    gate_.release(static_cast<std::ptrdiff_t>(workers_n_));
  }

  void join(void)
  {
    for (auto& w : workers_) {
      if ( w.joinable() ) {
        w.join();
      }
    }
    workers_.clear();
    running_.store(false, std::memory_order_relaxed);

    std::exception_ptr failure;
    {
      std::lock_guard<std::mutex> lock(result_mu_);
      failure = std::exchange(failure_, nullptr);
    }
    if ( failure ) {
      std::rethrow_exception(failure);
    }
  }

  CrawlSummary summary(void) const
  {
    std::lock_guard<std::mutex> lock(result_mu_);
    return summary_;
  }

  Snapshot snapshot(void) const
  {
    Snapshot snap{};
    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      snap.queued = queue_.size();
    }
    snap.processed = processed_.load(std::memory_order_relaxed);
    snap.active    = active_.load(std::memory_order_relaxed);
    snap.running   = running_.load(std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(activity_mu_);
      snap.last_activity = last_activity_;
    }
    return snap;
  }

private:
  using clock = std::chrono::system_clock;

  FrontierFactory factory_;
  size_t workers_n_;
  size_t max_queue_;

  mutable std::mutex queue_mu_;
  mutable std::mutex activity_mu_;
  mutable std::mutex result_mu_;
  std::deque<TopicSeed> queue_;
  std::counting_semaphore<> gate_{0};
  std::vector<std::jthread> workers_;

  std::atomic<bool> running_{false};
  std::atomic<bool> closed_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<size_t> processed_{0};
  std::atomic<size_t> active_{0};

  clock::time_point last_activity_{clock::now()};
  CrawlSummary summary_{};
  std::exception_ptr failure_{};

  std::function<void(const std::exception&)> on_error_{};

  void worker_loop_(std::stop_token token)
  {
    while ( true ) {
      gate_.acquire();

      if ( token.stop_requested() ) {
        break;
      }

      auto job = pop_job_();
      if ( !job ) {
        if ( closed_.load(std::memory_order_relaxed) ) {
          break;
        }
        continue;
      }

      active_.fetch_add(1, std::memory_order_relaxed);
      try {
        process_job_(*job, token);
      } catch (const std::exception& e) {
        lgr::get("crawler")->error("[{}] topic crawl aborted: {}", job->topic, e.what());
        record_failure_(std::current_exception());
        if ( on_error_ ) {
          on_error_(e);
        }
      }

      active_.fetch_sub(1, std::memory_order_relaxed);
      processed_.fetch_add(1, std::memory_order_relaxed);
      update_last_activity_();
    }
  }

  void process_job_(const TopicSeed& job, std::stop_token token)
  {
    if ( token.stop_requested() ) {
      return;
    }

    auto frontier = factory_(job);
    if ( !frontier ) {
      throw std::runtime_error("crwl::Runner factory returned no frontier for " + job.topic);
    }

    auto result = frontier->crawl(job, token);

    std::lock_guard<std::mutex> lock(result_mu_);
    auto& slot = summary_.at(result.topic);
    slot.fetched  += result.fetched;
    slot.accepted += result.accepted;
    slot.rejected += result.rejected;
    slot.errored  += result.errored;
  }

  void record_failure_(std::exception_ptr e)
  {
    std::lock_guard<std::mutex> lock(result_mu_);
    if ( !failure_ ) {
      failure_ = std::move(e);
    }
  }

  std::optional<TopicSeed> pop_job_(void)
  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    if ( queue_.empty() ) {
      return std::nullopt;
    }

    TopicSeed job = std::move(queue_.front());
    queue_.pop_front();
    return job;
  }

  void update_last_activity_(void)
  {
    std::lock_guard<std::mutex> lock(activity_mu_);
    last_activity_ = clock::now();
  }
};

} // end namespace crwl

#endif // !__CTXPIPE_CRAWLER_HPP
