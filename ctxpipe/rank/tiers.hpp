/*
 * tiers.hpp  Andrew Belles  Nov 26th, 2025
 *
 * Ranking tiers for the Retriever. A tier takes the candidate list of the
 * tier before it and hands back a scored, ordered list. Which tiers exist
 * is decided once, when the Retriever is built, from service availability
 *
 */

#ifndef __CTXPIPE_TIERS_HPP
#define __CTXPIPE_TIERS_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ctxpipe/services/services.hpp"

namespace rnk {

enum class Provenance : uint8_t {
  Entity,
  General,
  Document
};

std::string_view to_string(Provenance p) noexcept;

struct Candidate {
  std::string id;                   // record key or document url
  Provenance provenance{Provenance::Entity};
  std::string topic;
  std::string category;
  std::string title;
  std::string text;                 // what keyword and semantic scoring see
  std::string body;                 // rendered block for the context bundle
  std::vector<std::string> source_urls;
  int64_t updated_at{0};
  double score{0.0};                // score of the last tier applied
};

/************ scoring primitives **************************/

// Lowercase alphanumeric terms, stop words and one letter terms dropped,
// trailing plural s folded, first-seen order, no duplicates
std::vector<std::string> query_terms(std::string_view text);

// Fraction of distinct query terms present in the candidate text
double keyword_overlap(const std::vector<std::string>& terms, std::string_view text);

// Cosine similarity clamped to [0, 1], 0 for empty or mismatched vectors
double cosine(const std::vector<float>& a, const std::vector<float>& b) noexcept;

// Stable: score descending, then most recent update first
void order_candidates(std::vector<Candidate>& cands);

/************ EmbeddingCache ******************************/
/* Candidate embeddings keyed by id + text hash so an updated record is
 * embedded again. Internally synchronized
 */
class EmbeddingCache {
public:
  /********** get() ***************************************/
  /* Throws:
   *   svc::ServiceError from the service on a miss
   */
  std::vector<float> get(const Candidate& c, svc::EmbeddingService& service);

  size_t size() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::vector<float>> cache_;
};

/************ RankingTier *********************************/

class RankingTier {
public:
  virtual ~RankingTier() = default;

  virtual std::string_view name() const noexcept = 0;

  /********** rank() **************************************/
  /* Caller Provides:
   *   the query, the candidates from the previous tier and the number of
   *   items finally wanted
   *
   * We return:
   *   ordered candidates. First stage tiers return every candidate that
   *   scores above zero, a rerank tier at most max_items
   */
  virtual std::vector<Candidate> rank(const std::string& query,
                                      std::vector<Candidate> cands,
                                      size_t max_items) = 0;
};

// keyword overlap with weight 1.0
class KeywordTier final : public RankingTier {
public:
  std::string_view name() const noexcept override { return "keyword"; }
  std::vector<Candidate> rank(const std::string& query, std::vector<Candidate> cands,
                              size_t max_items) override;
};

// w_sem * cosine + w_kw * keyword. A query embedding failure degrades the
// query to the keyword tier
class HybridTier final : public RankingTier {
public:
  HybridTier(svc::EmbeddingService& service, EmbeddingCache& cache,
             double semantic_weight, double keyword_weight)
    : service_(service), cache_(cache), w_sem_(semantic_weight), w_kw_(keyword_weight) {}

  std::string_view name() const noexcept override { return "hybrid"; }
  std::vector<Candidate> rank(const std::string& query, std::vector<Candidate> cands,
                              size_t max_items) override;

private:
  svc::EmbeddingService& service_;
  EmbeddingCache& cache_;
  double w_sem_;
  double w_kw_;
};

// Re-scores the top pool candidates, returns the best max_items of them.
// A failing call returns the first max_items unchanged
class RerankTier final : public RankingTier {
public:
  RerankTier(svc::RerankService& service, size_t pool)
    : service_(service), pool_(pool) {}

  std::string_view name() const noexcept override { return "rerank"; }
  std::vector<Candidate> rank(const std::string& query, std::vector<Candidate> cands,
                              size_t max_items) override;

private:
  svc::RerankService& service_;
  size_t pool_;
};

} // end namespace rnk

#endif // !__CTXPIPE_TIERS_HPP
