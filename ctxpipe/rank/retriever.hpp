/*
 * retriever.hpp  Andrew Belles  Nov 26th, 2025
 *
 * Query side of the pipeline. Filters the latest corpus, runs it through
 * the composed ranking tiers and renders a token budgeted context bundle
 * for an answer generator. Never writes to the store
 *
 */

#ifndef __CTXPIPE_RETRIEVER_HPP
#define __CTXPIPE_RETRIEVER_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tiers.hpp"
#include "ctxpipe/extract/rules.hpp"
#include "ctxpipe/services/services.hpp"
#include "ctxpipe/store/content_store.hpp"

namespace rnk {

std::map<std::string, std::string> default_topic_aliases();
std::vector<xtr::CategorySpec> default_query_categories();

struct RetrievalConfig {
  double semantic_weight{0.6};
  double keyword_weight{0.4};
  size_t rerank_pool{20};
  size_t max_items{8};
  size_t token_budget{2000};        // approximate, chars / 4
  bool include_documents{false};    // document excerpts as a third section
  size_t excerpt_chars{600};
  std::map<std::string, std::string> topic_aliases{default_topic_aliases()};
  std::vector<xtr::CategorySpec> query_categories{default_query_categories()};
};

struct Filters {
  std::optional<std::string> topic;
  std::optional<std::string> category;
};

struct Citation {
  std::string source_url;
  Provenance provenance{Provenance::Entity};
};

struct BundleItem {
  Candidate candidate;
  double score{0.0};
};

struct ContextBundle {
  std::vector<BundleItem> items;
  std::string text;
  std::vector<Citation> citations;

  bool empty() const noexcept { return items.empty(); }
};

/************ assemble_bundle() ***************************/
/* Renders ranked candidates into labeled sections. Items are admitted in
 * rank order while the approximate token count fits the budget, the first
 * item is cut to the budget instead of being dropped
 */
ContextBundle assemble_bundle(std::vector<Candidate> ranked, size_t token_budget);

class Retriever {
public:
  /********** Retriever Constructor ***********************/
  /* Composes the tiers: hybrid when an embedding service is available,
   * keyword otherwise, then rerank when a reranker is available. Services
   * are borrowed and must outlive the Retriever
   */
  Retriever(dat::ContentStore& store, RetrievalConfig cfg,
            svc::EmbeddingService* embedder = nullptr,
            svc::RerankService* reranker = nullptr);

  /********** retrieve() **********************************/
  /* Caller Provides:
   *   the natural language query, optional explicit filters, and the item
   *   cap (0 means the configured default)
   *
   * We return:
   *   the bundle, empty with empty text when nothing matches
   */
  ContextBundle retrieve(const std::string& query,
                         const std::optional<std::string>& topic = std::nullopt,
                         const std::optional<std::string>& category = std::nullopt,
                         size_t max_items = 0);

  // Topic and category named in query, whole words only
  Filters detect_filters(const std::string& query);

  std::vector<std::string> tier_names() const;

private:
  dat::ContentStore& store_;
  RetrievalConfig cfg_;
  EmbeddingCache cache_;
  std::vector<std::unique_ptr<RankingTier>> tiers_;

  std::vector<Candidate> candidates_(const Filters& f);
  Candidate from_record_(const dat::Record& rec) const;
  Candidate from_document_(const dat::Document& doc) const;
};

} // end namespace rnk

#endif // !__CTXPIPE_RETRIEVER_HPP
