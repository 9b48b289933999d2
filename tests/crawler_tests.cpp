/*
 * crawler_tests.cpp  Andrew Belles  Nov 29th, 2025
 *
 * Frontier traversal, relevance gating, failure isolation and the Runner,
 * plus the url / html / fetch helpers they stand on. Network free: pages
 * come from a FakeSite
 *
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "ctxpipe/crawler/crawler.hpp"
#include "ctxpipe/crawler/html.hpp"
#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/crawler/http.hpp"
#include "ctxpipe/store/content_store.hpp"

using tst::expect;

namespace {

const std::string kA = "https://gov.example/visa/a";
const std::string kB = "https://gov.example/visa/b";
const std::string kC = "https://gov.example/visa/c";

crwl::CrawlPolicy
policy_(size_t depth = 2)
{
  crwl::CrawlPolicy p{};
  p.max_depth         = depth;
  p.max_docs_per_topic = 50;
  p.required_keywords = {"visa", "permit"};
  p.optional_keywords = {"fees"};
  p.min_content_chars = 50;
  return p;
}

std::string
visa_text_(const std::string& what)
{
  return "This visa page explains " + what + "." + tst::filler();
}

struct Harness {
  tst::FakeSite site;
  dat::ContentStore store{":memory:"};

  std::unique_ptr<crwl::Frontier>
  frontier(std::shared_ptr<crwl::RateLimiter> limiter = nullptr,
           std::function<void(const std::string&)> on_fetch = {})
  {
    return std::make_unique<crwl::Frontier>(
      std::make_unique<tst::FakeFetcher>(site, std::move(on_fetch)),
      std::move(limiter),
      [this](const dat::Document& d) { store.put_document(d); });
  }
};

void test_cycle_stores_each_page_once() {
  Harness h;
  h.site.page(kA, "A", visa_text_("a"), {kB, kC});
  h.site.page(kB, "B", visa_text_("b"), {kC, kA});
  h.site.page(kC, "C", visa_text_("c"), {kA, kB});

  auto f = h.frontier();
  std::vector<crwl::Seed> seeds{{kA, "uk"}, {kB, "uk"}, {kC, "uk"}};
  auto summary = f->crawl(seeds, policy_(2));

  const auto* uk = summary.find("uk");
  expect(uk != nullptr, "topic summary present");
  expect(uk->accepted == 3 && uk->fetched == 3, "three pages accepted");
  expect(uk->errored == 0, "no errors in a clean cycle");
  expect(h.store.get_latest_documents(std::string("uk")).size() == 3, "exactly three documents");
  for (const auto& url : {kA, kB, kC}) {
    expect(h.site.count(url) == 1, "each url fetched once: " + url);
    expect(h.store.document_history(url).size() == 1, "one version per url: " + url);
  }
}

void test_depth_bound() {
  Harness h;
  const std::string d1 = "https://gov.example/visa/d1";
  const std::string d2 = "https://gov.example/visa/d2";
  const std::string d3 = "https://gov.example/visa/d3";
  h.site.page(kA, "root", visa_text_("root"), {d1});
  h.site.page(d1, "d1", visa_text_("one"), {d2});
  h.site.page(d2, "d2", visa_text_("two"), {d3});
  h.site.page(d3, "d3", visa_text_("three"), {});

  auto f = h.frontier();
  auto sum = f->crawl(crwl::TopicSeed{"uk", {kA}, policy_(2)});
  expect(sum.accepted == 3, "depth 0..2 accepted");
  expect(h.site.count(d3) == 0, "depth 3 never fetched");

  for (const auto& doc : h.store.get_latest_documents()) {
    expect(doc.depth <= 2, "stored depth within bound");
  }
  expect(h.store.get_latest_document(d2)->depth == 2, "depth recorded on document");
}

void test_depth_zero_fetches_seeds_only() {
  Harness h;
  h.site.page(kA, "A", visa_text_("a"), {kB});
  h.site.page(kB, "B", visa_text_("b"), {});

  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_(0)});
  expect(sum.accepted == 1, "seed accepted");
  expect(h.site.count(kB) == 0, "links not followed at depth 0");
}

void test_required_keyword_gate() {
  Harness h;
  // only the optional keyword, none of the required ones
  h.site.page(kA, "Costs", "Our fees are listed below for every service." + tst::filler(), {});

  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_()});
  expect(sum.fetched == 1 && sum.rejected == 1 && sum.accepted == 0, "page rejected");
  expect(!h.store.get_latest_document(kA), "nothing stored for rejected url");
}

void test_empty_required_set_rejects() {
  Harness h;
  h.site.page(kA, "Fees page", "Only fees are listed here." + tst::filler(), {});
  auto p = policy_();
  p.required_keywords.clear();

  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, p});
  expect(sum.fetched == 1 && sum.rejected == 1 && sum.accepted == 0,
         "no required keyword can match");
  expect(!h.store.get_latest_document(kA), "nothing stored");

  const auto rel = crwl::assess_relevance("Fees page", "Only fees are listed here.", p);
  expect(!rel.accepted && rel.optional_hits == 1, "optional keyword alone never accepts");
}

void test_default_required_set() {
  const crwl::CrawlPolicy p{};
  expect(!p.required_keywords.empty(), "default policy gates on visa vocabulary");
  expect(crwl::assess_relevance("Student route", "Apply to study here.", p).accepted,
         "default vocabulary accepts a visa page");
  expect(!crwl::assess_relevance("Weather", "Sunny with light winds.", p).accepted,
         "default vocabulary rejects an unrelated page");
}

void test_short_content_rejected() {
  Harness h;
  h.site.page(kA, "Visa", "visa", {});
  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_()});
  expect(sum.rejected == 1 && sum.accepted == 0, "thin page rejected");
}

void test_relevance_score() {
  Harness h;
  h.site.page(kA, "Visa permit", "visa permit fees" + tst::filler(), {});
  h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_()});
  auto doc = h.store.get_latest_document(kA);
  expect(doc.has_value(), "document stored");
  expect(doc->relevance == 2.5, "two required hits plus half an optional hit");
}

void test_exclusion_prevents_fetch() {
  Harness h;
  const std::string pdf  = "https://gov.example/visa/form.pdf";
  const std::string news = "https://gov.example/news/visa-update";
  h.site.page(kA, "A", visa_text_("a"), {pdf, news, kB});
  h.site.page(kB, "B", visa_text_("b"), {});
  h.site.page(pdf, "pdf", visa_text_("pdf"), {});
  h.site.page(news, "news", visa_text_("news"), {});

  auto p = policy_();
  p.exclude_patterns = {"*.pdf", "/news/"};
  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, p});

  expect(h.site.count(pdf) == 0, "glob exclusion never fetched");
  expect(h.site.count(news) == 0, "substring exclusion never fetched");
  expect(sum.rejected == 2 && sum.accepted == 2, "exclusions count as rejected");
}

void test_off_origin_links_ignored() {
  Harness h;
  const std::string other = "https://elsewhere.example/visa";
  h.site.page(kA, "A", visa_text_("a"), {other});
  h.site.page(other, "other", visa_text_("other"), {});

  h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_()});
  expect(h.site.count(other) == 0, "links to another origin not followed");
}

void test_errors_never_abort() {
  Harness h;
  const std::string blocked = "https://gov.example/visa/blocked";
  const std::string slow    = "https://gov.example/visa/slow";
  const std::string gone    = "https://gov.example/visa/gone";
  h.site.page(kA, "A", visa_text_("a"), {blocked, slow, gone, kB});
  h.site.page(kB, "B", visa_text_("b"), {});
  h.site.fail(blocked, crwl::FetchErrc::Blocked);
  h.site.fail(slow, crwl::FetchErrc::Timeout);

  auto sum = h.frontier()->crawl(
    crwl::TopicSeed{"uk", {kA, "not a url"}, policy_()});
  expect(sum.errored == 4, "three failing fetches and one invalid seed");
  expect(sum.accepted == 2, "healthy pages still accepted");
  expect(h.store.get_latest_document(kB).has_value(), "crawl continued past failures");
}

void test_redirect_to_visited_skipped() {
  Harness h;
  const std::string alias = "https://gov.example/visa/alias";
  h.site.page(kA, "A", visa_text_("a"), {alias});
  h.site.redirect(alias, kA);

  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, policy_()});
  expect(sum.accepted == 1, "redirect back to a visited page adds nothing");
  expect(sum.rejected == 1, "redirect onto a visited page counts as rejected");
  expect(h.store.document_history(kA).size() == 1, "no second version for the target");
}

void test_redirect_to_excluded_rejected() {
  Harness h;
  const std::string moved  = "https://gov.example/visa/moved";
  const std::string target = "https://gov.example/news/visa-update";
  h.site.page(kA, "A", visa_text_("a"), {moved});
  h.site.redirect(moved, target);
  h.site.page(target, "news", visa_text_("news"), {kB});
  h.site.page(kB, "B", visa_text_("b"), {});

  auto p = policy_();
  p.exclude_patterns = {"/news/"};
  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, p});

  expect(sum.accepted == 1 && sum.rejected == 1, "redirect into an excluded path rejected");
  expect(!h.store.get_latest_document(target).has_value(), "excluded target never stored");
  expect(!h.store.get_latest_document(moved).has_value(), "redirect source never stored");
  expect(h.site.count(kB) == 0, "links of the excluded target not followed");
}

void test_document_cap() {
  Harness h;
  std::vector<std::string> links;
  for (int i = 0; i < 10; i++) {
    const std::string url = "https://gov.example/visa/p" + std::to_string(i);
    h.site.page(url, "p", visa_text_("p"), {});
    links.push_back(url);
  }
  h.site.page(kA, "A", visa_text_("a"), links);

  auto p = policy_();
  p.max_docs_per_topic = 4;
  auto sum = h.frontier()->crawl(crwl::TopicSeed{"uk", {kA}, p});
  expect(sum.accepted == 4, "cap bounds accepted documents");
  expect(h.store.get_latest_documents().size() == 4, "cap bounds stored documents");
}

void test_topics_in_order_with_shared_visited() {
  Harness h;
  h.site.page(kA, "A", visa_text_("a"), {});
  h.site.page(kB, "B", visa_text_("b"), {});

  std::vector<crwl::Seed> seeds{{kA, "uk"}, {kB, "canada"}, {kA, "canada"}};
  auto summary = h.frontier()->crawl(seeds, policy_());
  expect(summary.topics.size() == 2, "one summary per topic");
  expect(summary.topics[0].topic == "uk" && summary.topics[1].topic == "canada",
         "topics in order of first appearance");
  expect(h.site.count(kA) == 1, "url shared by two topics fetched once per run");
}

void test_stop_token_cancels() {
  Harness h;
  std::vector<std::string> links;
  for (int i = 0; i < 20; i++) {
    const std::string url = "https://gov.example/visa/s" + std::to_string(i);
    h.site.page(url, "s", visa_text_("s"), {});
    links.push_back(url);
  }
  h.site.page(kA, "A", visa_text_("a"), links);

  std::stop_source source;
  std::atomic<int> fetched{0};
  auto f = h.frontier(nullptr, [&](const std::string&) {
    if ( ++fetched == 3 ) {
      source.request_stop();
    }
  });

  auto sum = f->crawl(crwl::TopicSeed{"uk", {kA}, policy_()}, source.get_token());
  expect(sum.fetched == 3, "no fetch starts after stop");
  expect(h.store.get_latest_documents().size() == 3, "work done before stop is kept");
}

void test_rate_limiter_spacing() {
  crwl::RateLimiter limiter(millis{40});
  const auto start = std::chrono::steady_clock::now();
  expect(limiter.acquire("gov.example"), "first slot immediate");
  expect(limiter.acquire("gov.example"), "second slot after delay");
  expect(limiter.acquire("other.example"), "process scope covers every host");
  const auto spent = std::chrono::steady_clock::now() - start;
  expect(spent >= millis{80}, "three fetches span two delays");

  crwl::RateLimiter per_domain(millis{1000}, crwl::RateLimitScope::Domain);
  const auto t0 = std::chrono::steady_clock::now();
  per_domain.acquire("a.example");
  per_domain.acquire("b.example");
  expect(std::chrono::steady_clock::now() - t0 < millis{500}, "domain scope is per host");

  std::stop_source source;
  source.request_stop();
  expect(!per_domain.acquire("a.example", source.get_token()), "stopped wait books nothing");
}

void test_runner_topics_in_parallel() {
  Harness h;
  h.site.page(kA, "A", visa_text_("a"), {});
  h.site.page(kB, "B", visa_text_("b"), {});
  h.site.page(kC, "C", visa_text_("c"), {});

  auto limiter = std::make_shared<crwl::RateLimiter>(millis{0});
  crwl::Runner runner([&](const crwl::TopicSeed&) { return h.frontier(limiter); }, 2);
  runner.start();
  expect(runner.enqueue(crwl::TopicSeed{"uk", {kA}, policy_()}), "job accepted");
  expect(runner.enqueue(crwl::TopicSeed{"canada", {kB}, policy_()}), "job accepted");
  expect(runner.enqueue(crwl::TopicSeed{"australia", {kC}, policy_()}), "job accepted");
  runner.close();
  runner.join();

  auto summary = runner.summary();
  expect(summary.topics.size() == 3, "three topic summaries");
  for (const auto& t : summary.topics) {
    expect(t.accepted == 1 && t.errored == 0, "each topic accepted its page: " + t.topic);
  }
  expect(runner.snapshot().processed == 3, "three jobs processed");
  expect(!runner.enqueue(crwl::TopicSeed{"late", {kA}, policy_()}), "closed runner refuses jobs");
}

void test_runner_surfaces_sink_failure() {
  tst::FakeSite site;
  site.page(kA, "A", visa_text_("a"), {});

  crwl::Runner runner([&](const crwl::TopicSeed&) {
    return std::make_unique<crwl::Frontier>(
      std::make_unique<tst::FakeFetcher>(site), nullptr,
      [](const dat::Document& d) { throw dat::StoreConflict(d.url, "scripted"); });
  }, 1);

  std::atomic<int> errors{0};
  runner.set_on_error([&](const std::exception&) { errors++; });
  runner.start();
  runner.enqueue(crwl::TopicSeed{"uk", {kA}, policy_()});
  runner.close();
  expect(tst::throws_as<dat::StoreConflict>([&] { runner.join(); }),
         "store failure reaches the caller");
  expect(errors == 1, "error callback invoked");
}

void test_url_normalization() {
  expect(htc::normalize_url("HTTPS://Gov.Example:443/a/./b/../c/?") == "https://gov.example/a/c",
         "scheme host port dot segments and empty query normalized");
  expect(htc::normalize_url("https://gov.example/visa/#apply") == "https://gov.example/visa",
         "fragment and trailing slash dropped");
  expect(htc::normalize_url("http://gov.example") == "http://gov.example/", "root path kept");
  expect(tst::throws_as<std::invalid_argument>([] { htc::normalize_url("ftp://x/y"); }),
         "non http scheme rejected");
  expect(htc::resolve_url("https://gov.example/visa/a", "b") == "https://gov.example/visa/b",
         "relative link resolved");
  expect(htc::resolve_url("https://gov.example/visa/a", "mailto:x@y").empty(),
         "non crawlable scheme dropped");
  expect(htc::same_origin("https://gov.example/a", "https://gov.example:443/b"),
         "default port is same origin");
  expect(!htc::same_origin("https://gov.example/a", "http://gov.example/a"),
         "scheme change is another origin");
}

void test_exclusion_patterns() {
  const std::vector<std::string> pats{"*.pdf", "/login", "*/archive/*"};
  expect(crwl::is_excluded("https://gov.example/forms/F1.PDF", pats), "glob on path, any case");
  expect(crwl::is_excluded("https://gov.example/account/login?next=x", pats), "substring");
  expect(crwl::is_excluded("https://gov.example/visa/archive/2019", pats), "nested glob");
  expect(!crwl::is_excluded("https://gov.example/visa/apply", pats), "clean url passes");
  expect(!crwl::is_excluded("https://gov.example/visa/apply", {}), "no patterns");
}

void test_parse_html() {
  const std::string raw =
    "<html><head><title> Skilled Worker  Visa </title>"
    "<script>var x = 'hidden';</script><style>p{}</style></head>"
    "<body><nav><a href='/menu'>Menu</a></nav>"
    "<h1>Eligibility</h1><p>You must be at least 18.</p>"
    "<p>See <a href='fees#table'>fees</a> and <a href='https://gov.example/visa/fees'>again</a>"
    " or <a href='mailto:help@gov.example'>mail</a>.</p>"
    "<footer>Crown copyright</footer></body></html>";

  auto page = htm::parse_html(raw, "https://gov.example/visa/skilled");
  expect(page.title == "Skilled Worker Visa", "title collapsed");
  expect(page.text.find("You must be at least 18.") != std::string::npos, "body text kept");
  expect(page.text.find("hidden") == std::string::npos, "script skipped");
  expect(page.text.find("Menu") == std::string::npos, "nav skipped");
  expect(page.text.find("Crown") == std::string::npos, "footer skipped");
  expect(page.links.size() == 1 && page.links[0] == "https://gov.example/visa/fees",
         "links resolved, normalized and deduplicated");

  auto broken = htm::parse_html("<p>unclosed <b>markup", "https://gov.example/");
  expect(broken.text.find("unclosed") != std::string::npos, "malformed markup recovered");
  expect(htm::parse_html("", "https://gov.example/").text.empty(), "empty input, empty page");
}

void test_status_classification() {
  using crwl::FetchErrc;
  expect(crwl::classify_status(403, "") == FetchErrc::Blocked, "403 blocked");
  expect(crwl::classify_status(429, "") == FetchErrc::Blocked, "429 blocked");
  expect(crwl::classify_status(404, "") == FetchErrc::NotFound, "404 not found");
  expect(crwl::classify_status(410, "") == FetchErrc::NotFound, "410 not found");
  expect(crwl::classify_status(504, "") == FetchErrc::Timeout, "504 timeout");
  expect(crwl::classify_status(503, "<h1>Attention Required! | Cloudflare</h1>") ==
         FetchErrc::Blocked, "challenge page blocked");
  expect(crwl::classify_status(503, "maintenance") == FetchErrc::Other, "plain 503 other");
  expect(crwl::classify_status(500, "") == FetchErrc::Other, "500 other");
}

void test_render_payload() {
  crwl::FetchConfig cfg{};
  cfg.render_endpoint = "http://render.local:3000";
  cfg.render_settle   = millis{750};
  crwl::RenderingFetcher fetcher(cfg);

  auto payload = jsc::as_obj(jsc::parse(fetcher.build_payload("https://gov.example/x", millis{9000})));
  expect(payload.at("url").as_string() == "https://gov.example/x", "payload url");
  const auto& go = payload.at("gotoOptions").as_object();
  expect(go.at("waitUntil").as_string() == "networkidle2", "default wait condition");
  expect(go.at("timeout").as_int64() == 9000, "navigation timeout");
  expect(payload.at("waitForTimeout").as_int64() == 750, "settle delay");
  const auto& headers = payload.at("setExtraHTTPHeaders").as_object();
  expect(std::string(headers.at("User-Agent").as_string().c_str()) == cfg.user_agent,
         "identifying user agent");

  expect(crwl::make_fetcher(crwl::StrategyKind::Rendering, cfg)->name() == "rendering",
         "factory builds the rendering strategy");
  expect(crwl::make_fetcher(crwl::StrategyKind::Lightweight, cfg)->name() == "lightweight",
         "factory builds the lightweight strategy");
  expect(crwl::parse_strategy("render") == crwl::StrategyKind::Rendering, "strategy alias");

  expect(fetcher.endpoint().target == "/content", "no token, bare endpoint");
  cfg.render_token = "a&b=c d/+";
  crwl::RenderingFetcher with_token(cfg);
  expect(with_token.endpoint().target == "/content?token=a%26b%3Dc%20d%2F%2B",
         "token percent encoded into the query");
  expect(htc::percent_encode("Az09-_.~") == "Az09-_.~", "unreserved characters kept");
  expect(!crwl::parse_strategy("selenium"), "unknown strategy");
}

}

int main() {
  tst::quiet_logs();
  std::cout << "=== ctxpipe crawler tests ===\n";
  tst::run_test("cycle stores each page once", test_cycle_stores_each_page_once);
  tst::run_test("depth bound", test_depth_bound);
  tst::run_test("depth zero fetches seeds only", test_depth_zero_fetches_seeds_only);
  tst::run_test("required keyword gate", test_required_keyword_gate);
  tst::run_test("empty required set rejects", test_empty_required_set_rejects);
  tst::run_test("default required set", test_default_required_set);
  tst::run_test("short content rejected", test_short_content_rejected);
  tst::run_test("relevance score", test_relevance_score);
  tst::run_test("exclusion prevents fetch", test_exclusion_prevents_fetch);
  tst::run_test("off origin links ignored", test_off_origin_links_ignored);
  tst::run_test("errors never abort", test_errors_never_abort);
  tst::run_test("redirect to visited skipped", test_redirect_to_visited_skipped);
  tst::run_test("redirect to excluded rejected", test_redirect_to_excluded_rejected);
  tst::run_test("document cap", test_document_cap);
  tst::run_test("topics in order, shared visited set", test_topics_in_order_with_shared_visited);
  tst::run_test("stop token cancels", test_stop_token_cancels);
  tst::run_test("rate limiter spacing", test_rate_limiter_spacing);
  tst::run_test("runner topics in parallel", test_runner_topics_in_parallel);
  tst::run_test("runner surfaces sink failure", test_runner_surfaces_sink_failure);
  tst::run_test("url normalization", test_url_normalization);
  tst::run_test("exclusion patterns", test_exclusion_patterns);
  tst::run_test("parse html", test_parse_html);
  tst::run_test("status classification", test_status_classification);
  tst::run_test("render payload", test_render_payload);
  return tst::finish("crawler");
}
