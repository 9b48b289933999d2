/*
 * rank_tests.cpp  Andrew Belles  Nov 29th, 2025
 *
 * Ranking tiers, their fallbacks, filter detection and context bundle
 * assembly under a token budget
 *
 */

#include <algorithm>
#include <exception>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "ctxpipe/rank/retriever.hpp"
#include "ctxpipe/rank/tiers.hpp"
#include "ctxpipe/services/services.hpp"
#include "ctxpipe/store/content_store.hpp"

using tst::expect;

namespace {

const std::vector<std::string> kVocab{"skilled", "worker", "student", "family", "visa", "fee"};

dat::Record
entity_(const std::string& name, const std::string& topic, const std::string& category,
        const std::string& url)
{
  dat::Record r{};
  r.name        = name;
  r.topic       = topic;
  r.category    = category;
  r.kind        = dat::RecordKind::Entity;
  r.key         = dat::make_record_key(name, topic);
  r.source_urls = {url};
  return r;
}

void
seed_store_(dat::ContentStore& store)
{
  auto skilled = entity_("Skilled Worker Visa", "uk", "work", "https://gov.example/skilled");
  skilled.fields["age_min"] = 18;
  skilled.fields["application_fee"] = "$100";
  store.put_record(skilled);

  auto student = entity_("Student Visa", "uk", "study", "https://gov.example/student");
  student.fields["language"] = "IELTS 5.5";
  store.put_record(student);

  auto family = entity_("Family Visa", "uk", "family", "https://gov.example/family");
  store.put_record(family);

  auto guide = entity_("Visa Fees Guide", "uk", "general", "https://gov.example/fees-guide");
  guide.kind       = dat::RecordKind::General;
  guide.summary    = "Every visa carries an application fee paid online.";
  guide.key_points = {"Fees are paid when you apply."};
  store.put_record(guide);

  auto ca = entity_("Express Entry Skilled Worker", "canada", "work", "https://ca.example/ee");
  store.put_record(ca);
}

std::vector<std::string>
ids_(const rnk::ContextBundle& b)
{
  std::vector<std::string> out;
  for (const auto& item : b.items) {
    out.push_back(item.candidate.id);
  }
  return out;
}

rnk::Candidate
cand_(const std::string& id, rnk::Provenance p, const std::string& body, double score = 0.0)
{
  rnk::Candidate c{};
  c.id          = id;
  c.provenance  = p;
  c.body        = body;
  c.text        = body;
  c.score       = score;
  c.source_urls = {"https://gov.example/" + id};
  return c;
}

void test_zero_candidates_is_empty_bundle() {
  dat::ContentStore store(":memory:");
  seed_store_(store);
  rnk::Retriever r(store, rnk::RetrievalConfig{});

  auto bundle = r.retrieve("skilled worker visa", std::string("australia"));
  expect(bundle.empty() && bundle.items.empty(), "no items");
  expect(bundle.text.empty() && bundle.citations.empty(), "no text and no citations");

  dat::ContentStore empty_store(":memory:");
  rnk::Retriever r2(empty_store, rnk::RetrievalConfig{});
  expect(r2.retrieve("anything at all").empty(), "empty corpus is not an error");
}

void test_rerank_draws_from_top_pool() {
  dat::ContentStore store(":memory:");
  for (int i = 0; i < 25; i++) {
    auto rec = entity_("Skilled Program " + std::to_string(i), "uk", "work",
                       "https://gov.example/p" + std::to_string(i));
    // more matching words for lower i, so hybrid order is the index order
    std::string summary = "skilled";
    if ( i < 20 ) summary += " worker";
    if ( i < 10 ) summary += " visa";
    if ( i < 5 )  summary += " fee";
    rec.summary = summary;
    store.put_record(rec);
  }

  tst::FakeEmbedding embed(kVocab);
  tst::FakeRerank rerank;
  rnk::RetrievalConfig cfg{};
  cfg.rerank_pool = 20;
  rnk::Retriever hybrid_only(store, cfg, &embed);
  rnk::Retriever full(store, cfg, &embed, &rerank);

  expect(full.tier_names() == std::vector<std::string>{"hybrid", "rerank"}, "hybrid then rerank");

  const std::string q = "skilled worker visa fee";
  auto reference = hybrid_only.retrieve(q, std::nullopt, std::nullopt, 25);
  expect(reference.items.size() == 25, "every candidate passes hybrid scoring");
  const auto order = ids_(reference);
  const std::vector<std::string> top20(order.begin(), order.begin() + 20);

  auto bundle = full.retrieve(q, std::nullopt, std::nullopt, 5);
  expect(bundle.items.size() == 5, "exactly max_items returned");
  expect(rerank.seen == 20, "reranker sees the pool only");
  for (const auto& id : ids_(bundle)) {
    expect(std::find(top20.begin(), top20.end(), id) != top20.end(),
           "reranked item comes from the top 20: " + id);
  }
  expect(ids_(bundle).front() == top20.back(), "rerank order applied");
}

void test_rerank_failure_keeps_first_stage() {
  dat::ContentStore store(":memory:");
  seed_store_(store);

  tst::FakeEmbedding embed(kVocab);
  tst::FakeRerank broken(true);
  rnk::Retriever with_broken(store, rnk::RetrievalConfig{}, &embed, &broken);
  rnk::Retriever hybrid_only(store, rnk::RetrievalConfig{}, &embed);

  auto a = with_broken.retrieve("visa language requirements", std::nullopt, std::nullopt, 2);
  auto b = hybrid_only.retrieve("visa language requirements", std::nullopt, std::nullopt, 2);
  expect(a.items.size() == 2, "top-K still returned");
  expect(ids_(a) == ids_(b), "hybrid order used when rerank fails");
  expect(a.text == b.text, "same bundle either way");

  tst::FakeRerank odd(tst::FakeRerank::Failure::Other);
  rnk::Retriever with_odd(store, rnk::RetrievalConfig{}, &embed, &odd);
  rnk::ContextBundle c;
  const bool threw = tst::throws_as<std::exception>([&] {
    c = with_odd.retrieve("visa language requirements", std::nullopt, std::nullopt, 2);
  });
  expect(!threw, "any rerank failure stays inside the tier");
  expect(ids_(c) == ids_(b), "hybrid order used for a non service failure");
}

void test_rerank_reply_parsing() {
  auto parse = [](const char* text, size_t n) {
    return svc::parse_rerank_reply(boost::json::parse(text), n);
  };

  auto scores = parse(R"([{"index": 1, "score": 0.9}, {"index": 0, "score": 0.2}])", 2);
  expect(scores == std::vector<double>{0.2, 0.9}, "scores back in input order");

  auto rejects = [&](const char* text) {
    return tst::throws_as<svc::ServiceError>([&] { parse(text, 2); });
  };
  expect(rejects(R"([{"index": 1.5, "score": 0.9}, {"index": 0, "score": 0.2}])"),
         "fractional index");
  expect(rejects(R"([{"index": 18446744073709551615, "score": 0.9}])"), "huge index");
  expect(rejects(R"([{"index": -1, "score": 0.9}])"), "negative index");
  expect(rejects(R"([{"index": 2, "score": 0.9}])"), "index past the texts");
  expect(rejects(R"([{"index": 0, "score": "high"}])"), "non numeric score");
  expect(rejects(R"([{"index": 0, "score": 0.5}])"), "unscored text");
  expect(rejects(R"({"index": 0})"), "object reply");
}

void test_keyword_only_without_embedder() {
  dat::ContentStore store(":memory:");
  seed_store_(store);

  tst::DownService down;
  rnk::Retriever none(store, rnk::RetrievalConfig{});
  rnk::Retriever unavailable(store, rnk::RetrievalConfig{}, &down);
  expect(none.tier_names() == std::vector<std::string>{"keyword"}, "keyword tier only");
  expect(unavailable.tier_names() == none.tier_names(), "unavailable service not composed");

  auto a = none.retrieve("skilled worker fee");
  auto b = unavailable.retrieve("skilled worker fee");
  expect(!a.empty() && ids_(a) == ids_(b), "identical ordering");
  expect(a.items.front().candidate.id == dat::make_record_key("Skilled Worker Visa", "uk"),
         "best keyword match first");
}

void test_query_embedding_failure_degrades() {
  dat::ContentStore store(":memory:");
  seed_store_(store);

  tst::FakeEmbedding failing(kVocab, true);
  rnk::Retriever hybrid(store, rnk::RetrievalConfig{}, &failing);
  rnk::Retriever keyword(store, rnk::RetrievalConfig{});

  auto a = hybrid.retrieve("visa fee");
  auto b = keyword.retrieve("visa fee");
  expect(a.items.size() == 4, "every record naming a visa");
  expect(ids_(a) == ids_(b), "failed query embedding ranks by keyword");
}

void test_filter_detection() {
  dat::ContentStore store(":memory:");
  seed_store_(store);
  rnk::Retriever r(store, rnk::RetrievalConfig{});

  auto f = r.detect_filters("What are the work visa rules in the United Kingdom?");
  expect(f.topic == "uk", "alias resolves to topic");
  expect(f.category == "work", "category keyword detected");

  auto g = r.detect_filters("students moving to Canada");
  expect(g.topic == "canada" && g.category == "study", "stored topic and plural keyword");

  auto h = r.detect_filters("houses in bonus land");
  expect(!h.topic && !h.category, "no partial word matches");
}

void test_filters_narrow_and_widen() {
  dat::ContentStore store(":memory:");
  seed_store_(store);
  rnk::Retriever r(store, rnk::RetrievalConfig{});

  auto canada = r.retrieve("skilled worker in canada");
  expect(canada.items.size() == 1 && canada.items[0].candidate.topic == "canada",
         "detected topic narrows the corpus");

  // usa is detected but has no records, so the hint is dropped
  auto widened = r.retrieve("skilled worker jobs in america");
  expect(!widened.empty(), "empty detected filter widens");

  auto bound = r.retrieve("skilled worker", std::string("uk"), std::string("tourist"));
  expect(bound.empty(), "explicit filters bind");

  auto study = r.retrieve("visa", std::string("uk"), std::string("study"));
  expect(study.items.size() == 1 && study.items[0].candidate.category == "study",
         "explicit category filter applies");
}

void test_documents_as_third_tier() {
  dat::ContentStore store(":memory:");
  seed_store_(store);
  dat::Document d{};
  d.url          = "https://gov.example/visitor";
  d.topic        = "uk";
  d.title        = "Standard Visitor";
  d.content_text = std::string(900, 'x') + " visitor visa";
  store.put_document(d);

  rnk::RetrievalConfig cfg{};
  cfg.include_documents = true;
  cfg.excerpt_chars = 100;
  rnk::Retriever r(store, cfg);

  auto bundle = r.retrieve("visitor visa", std::string("uk"));
  const auto it = std::find_if(bundle.items.begin(), bundle.items.end(), [](const auto& i) {
    return i.candidate.provenance == rnk::Provenance::Document;
  });
  expect(it != bundle.items.end(), "document candidate admitted");
  expect(bundle.text.find("=== DOCUMENT EXCERPTS ===") != std::string::npos, "excerpt section");
  expect(it->candidate.body.size() < 300, "excerpt is cut");
}

void test_bundle_sections_and_citations() {
  std::vector<rnk::Candidate> ranked{
    cand_("g1", rnk::Provenance::General, "guide body", 0.9),
    cand_("e1", rnk::Provenance::Entity, "entity one", 0.8),
    cand_("e2", rnk::Provenance::Entity, "entity two", 0.7),
  };
  ranked[2].source_urls.push_back(ranked[1].source_urls[0]);

  auto b = rnk::assemble_bundle(ranked, 0);
  expect(b.items.size() == 3, "unbounded budget admits all");
  expect(b.text ==
         "=== VISA PROGRAMS ===\n[2] entity one\n---\n[3] entity two\n\n"
         "=== GENERAL INFORMATION ===\n[1] guide body",
         "sections in fixed order, numbered by rank");
  expect(b.citations.size() == 3, "duplicate citation collapsed");
  expect(b.items[0].score == 0.9, "score carried on item");
}

void test_bundle_budget() {
  const std::string hundred(100, 'a');
  std::vector<rnk::Candidate> ranked{
    cand_("e1", rnk::Provenance::Entity, hundred),
    cand_("e2", rnk::Provenance::Entity, hundred),
    cand_("g1", rnk::Provenance::General, std::string(20, 'g')),
  };

  auto b = rnk::assemble_bundle(ranked, 50);
  expect(b.items.size() == 2, "item that does not fit is skipped, smaller one admitted");
  expect(b.items[1].candidate.id == "g1", "later smaller item admitted");
  expect(b.text.size() == 180 && b.text.size() <= 50 * 4, "text within the budget");

  auto cut = rnk::assemble_bundle({cand_("e1", rnk::Provenance::Entity, hundred)}, 10);
  expect(cut.items.size() == 1, "first item always admitted");
  expect(cut.text.size() == 40, "first item cut to the budget");
  expect(cut.text.substr(cut.text.size() - 3) == "...", "cut is marked");

  expect(rnk::assemble_bundle({}, 100).text.empty(), "nothing ranked, nothing rendered");
}

void test_scoring_primitives() {
  auto terms = rnk::query_terms("What are the Fees for the skilled visas?");
  expect(terms == std::vector<std::string>{"fee", "skilled", "visa"},
         "stop words dropped, plurals folded");
  expect(rnk::keyword_overlap({"fee", "visa"}, "Visa fees apply") == 1.0, "full overlap");
  expect(rnk::keyword_overlap({"fee", "visa"}, "nothing") == 0.0, "no overlap");
  expect(rnk::keyword_overlap({}, "visa") == 0.0, "empty query");

  expect(rnk::cosine({1, 0}, {1, 0}) == 1.0, "identical vectors");
  expect(rnk::cosine({1, 0}, {-1, 0}) == 0.0, "negative similarity clamped");
  expect(rnk::cosine({1, 0}, {1, 0, 0}) == 0.0, "dimension mismatch");

  std::vector<rnk::Candidate> c{cand_("old", rnk::Provenance::Entity, "", 0.5),
                                cand_("new", rnk::Provenance::Entity, "", 0.5),
                                cand_("top", rnk::Provenance::Entity, "", 0.9)};
  c[0].updated_at = 1;
  c[1].updated_at = 2;
  rnk::order_candidates(c);
  expect(c[0].id == "top" && c[1].id == "new" && c[2].id == "old",
         "score first, recency breaks ties");
}

void test_embedding_cache() {
  tst::FakeEmbedding embed(kVocab);
  rnk::EmbeddingCache cache;
  auto c = cand_("k", rnk::Provenance::Entity, "skilled worker");

  cache.get(c, embed);
  cache.get(c, embed);
  expect(embed.calls == 1 && cache.size() == 1, "second lookup served from cache");

  c.text = "skilled worker visa";
  cache.get(c, embed);
  expect(embed.calls == 2 && cache.size() == 2, "changed text embedded again");
}

}

int main() {
  tst::quiet_logs();
  std::cout << "=== ctxpipe ranking tests ===\n";
  tst::run_test("zero candidates is an empty bundle", test_zero_candidates_is_empty_bundle);
  tst::run_test("rerank draws from the top pool", test_rerank_draws_from_top_pool);
  tst::run_test("rerank failure keeps first stage", test_rerank_failure_keeps_first_stage);
  tst::run_test("rerank reply parsing", test_rerank_reply_parsing);
  tst::run_test("keyword only without embedder", test_keyword_only_without_embedder);
  tst::run_test("query embedding failure degrades", test_query_embedding_failure_degrades);
  tst::run_test("filter detection", test_filter_detection);
  tst::run_test("filters narrow and widen", test_filters_narrow_and_widen);
  tst::run_test("documents as third section", test_documents_as_third_tier);
  tst::run_test("bundle sections and citations", test_bundle_sections_and_citations);
  tst::run_test("bundle budget", test_bundle_budget);
  tst::run_test("scoring primitives", test_scoring_primitives);
  tst::run_test("embedding cache", test_embedding_cache);
  return tst::finish("rank");
}
