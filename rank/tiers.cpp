/*
 * tiers.cpp  Andrew Belles  Nov 26th, 2025
 *
 */

#include "ctxpipe/rank/tiers.hpp"
#include "ctxpipe/crawler/crawler_support.hpp"
#include "ctxpipe/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <unordered_set>

namespace {

static const std::unordered_set<std::string>&
stop_words_()
{
  static const std::unordered_set<std::string> words = {
    "a", "an", "and", "are", "as", "at", "be", "by", "can", "do", "does", "for",
    "from", "how", "i", "in", "is", "it", "me", "my", "of", "on", "or", "that",
    "the", "this", "to", "what", "when", "where", "which", "who", "with", "you",
    "your", "about", "there", "any", "get", "need"
  };
  return words;
}

static std::string
fold_(std::string term)
{
  if ( term.size() > 3 && term.back() == 's' && term[term.size() - 2] != 's' ) {
    term.pop_back();
  }
  return term;
}

static std::vector<std::string>
terms_of_(std::string_view text, bool drop_stop_words)
{
  std::vector<std::string> out;
  std::string current;

  auto flush = [&] {
    if ( current.size() > 1 && (!drop_stop_words || !stop_words_().count(current)) ) {
      out.push_back(fold_(current));
    }
    current.clear();
  };

  for (unsigned char c : text) {
    if ( std::isalnum(c) ) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();
  return out;
}

static double
keyword_score_(const std::vector<std::string>& terms, const rnk::Candidate& c)
{
  return rnk::keyword_overlap(terms, c.text);
}

static std::vector<rnk::Candidate>
keyword_rank_(const std::string& query, std::vector<rnk::Candidate> cands)
{
  const auto terms = rnk::query_terms(query);
  std::vector<rnk::Candidate> out;
  out.reserve(cands.size());
  for (auto& c : cands) {
    c.score = keyword_score_(terms, c);
    if ( c.score > 0.0 ) {
      out.push_back(std::move(c));
    }
  }
  rnk::order_candidates(out);
  return out;
}

}

namespace rnk {

std::string_view
to_string(Provenance p) noexcept
{
  switch ( p ) {
    case Provenance::Entity:   return "entity";
    case Provenance::General:  return "general";
    case Provenance::Document: return "document";
  }
  return "entity";
}

std::vector<std::string>
query_terms(std::string_view text)
{
  std::vector<std::string> out;
  for (auto& t : terms_of_(text, true)) {
    if ( std::find(out.begin(), out.end(), t) == out.end() ) {
      out.push_back(std::move(t));
    }
  }
  return out;
}

double
keyword_overlap(const std::vector<std::string>& terms, std::string_view text)
{
  if ( terms.empty() ) {
    return 0.0;
  }

  const auto words = terms_of_(text, false);
  const std::unordered_set<std::string> present(words.begin(), words.end());

  size_t hits = 0;
  for (const auto& t : terms) {
    if ( present.count(t) ) {
      hits++;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(terms.size());
}

double
cosine(const std::vector<float>& a, const std::vector<float>& b) noexcept
{
  if ( a.empty() || a.size() != b.size() ) {
    return 0.0;
  }

  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i{0}; i < a.size(); i++) {
    dot += static_cast<double>(a[i]) * b[i];
    na  += static_cast<double>(a[i]) * a[i];
    nb  += static_cast<double>(b[i]) * b[i];
  }
  if ( na == 0.0 || nb == 0.0 ) {
    return 0.0;
  }
  return std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), 0.0, 1.0);
}

void
order_candidates(std::vector<Candidate>& cands)
{
  std::stable_sort(cands.begin(), cands.end(), [](const Candidate& a, const Candidate& b) {
    if ( a.score != b.score ) {
      return a.score > b.score;
    }
    return a.updated_at > b.updated_at;
  });
}

std::vector<float>
EmbeddingCache::get(const Candidate& c, svc::EmbeddingService& service)
{
  const std::string key = c.id + "#" + std::to_string(std::hash<std::string>{}(c.text));
  {
    std::lock_guard<std::mutex> lock(mu_);
    if ( auto it = cache_.find(key); it != cache_.end() ) {
      return it->second;
    }
  }

  // embed outside the lock, a racing duplicate costs one extra call
  auto vec = service.embed(c.text);

  std::lock_guard<std::mutex> lock(mu_);
  cache_.emplace(key, vec);
  return vec;
}

size_t
EmbeddingCache::size() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return cache_.size();
}

std::vector<Candidate>
KeywordTier::rank(const std::string& query, std::vector<Candidate> cands, size_t)
{
  return keyword_rank_(query, std::move(cands));
}

/************ HybridTier::rank ****************************/
/* A candidate whose own embedding fails keeps its keyword part only, a
 * failing query embedding turns the whole query into a keyword query
 */
std::vector<Candidate>
HybridTier::rank(const std::string& query, std::vector<Candidate> cands, size_t)
{
  auto log = lgr::get("retrieve");

  std::vector<float> qvec;
  try {
    qvec = service_.embed(query);
  } catch (const std::exception& e) {
    log->warn("query embedding failed, keyword scoring for this query: {}", e.what());
    return keyword_rank_(query, std::move(cands));
  }

  const auto terms = query_terms(query);
  std::vector<Candidate> out;
  out.reserve(cands.size());
  for (auto& c : cands) {
    double semantic = 0.0;
    try {
      semantic = cosine(qvec, cache_.get(c, service_));
    } catch (const std::exception& e) {
      log->debug("embedding failed for {}: {}", c.id, e.what());
    }

    c.score = w_sem_ * semantic + w_kw_ * keyword_score_(terms, c);
    if ( c.score > 0.0 ) {
      out.push_back(std::move(c));
    }
  }
  order_candidates(out);
  return out;
}

std::vector<Candidate>
RerankTier::rank(const std::string& query, std::vector<Candidate> cands, size_t max_items)
{
  if ( cands.size() > pool_ ) {
    cands.resize(pool_);
  }
  if ( cands.empty() ) {
    return cands;
  }

  std::vector<std::string> texts;
  texts.reserve(cands.size());
  for (const auto& c : cands) {
    texts.push_back(c.text);
  }

  std::vector<double> scores;
  try {
    scores = service_.rerank(query, texts);
  } catch (const std::exception& e) {
    lgr::get("retrieve")->warn("rerank failed, keeping first stage order: {}", e.what());
    if ( cands.size() > max_items ) {
      cands.resize(max_items);
    }
    return cands;
  }

  if ( scores.size() != cands.size() ) {
    lgr::get("retrieve")->warn("rerank returned {} score(s) for {} candidate(s), ignored",
                               scores.size(), cands.size());
    if ( cands.size() > max_items ) {
      cands.resize(max_items);
    }
    return cands;
  }

  for (size_t i{0}; i < cands.size(); i++) {
    cands[i].score = scores[i];
  }
  order_candidates(cands);
  if ( cands.size() > max_items ) {
    cands.resize(max_items);
  }
  return cands;
}

}
