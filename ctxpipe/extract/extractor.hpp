/*
 * extractor.hpp  Andrew Belles  Nov 24th, 2025
 *
 * Turns stored Documents into Records. Classifies, extracts typed fields
 * (entity) or summary + key points (general), merges with the current
 * Record for the same key and writes the result back as a new version
 *
 */

#ifndef __CTXPIPE_EXTRACTOR_HPP
#define __CTXPIPE_EXTRACTOR_HPP

#include <optional>
#include <string>

#include "rules.hpp"
#include "ctxpipe/services/services.hpp"
#include "ctxpipe/store/content_store.hpp"
#include "ctxpipe/store/model.hpp"

namespace xtr {

struct ExtractSummary {
  size_t processed{0};
  size_t extracted{0};
  size_t skipped{0};
  size_t errors{0};
};

/************ merge_records() *****************************/
/* First write wins: populated fields of current are never overwritten,
 * fields only incoming has are added, source urls and key points are
 * appended when unseen (order kept). Identity fields stay those of current
 */
dat::Record merge_records(const dat::Record& current, const dat::Record& incoming);

// True when a and b carry the same content (versions and timestamps ignored)
bool same_content(const dat::Record& a, const dat::Record& b);

class Extractor {
public:
  /********** Extractor Constructor ***********************/
  /* Caller Provides:
   *   the store to read Documents from and write Records into, an optional
   *   assist service used to fill fields the rules missed. Both must
   *   outlive the Extractor
   */
  Extractor(dat::ContentStore& store, ExtractConfig cfg,
            svc::AssistService* assist = nullptr);

  /********** extract() ***********************************/
  /* Candidate Record for doc, no store access. nullopt on low confidence
   */
  std::optional<dat::Record> extract(const dat::Document& doc) const;

  /********** classify_and_extract() **********************/
  /* extract() + merge with the current Record + write back.
   *
   * We return:
   *   the current Record after the call (unchanged when the merge added
   *   nothing), nullopt on low confidence
   *
   * Throws:
   *   dat::StoreConflict when the version flip fails
   */
  std::optional<dat::Record> classify_and_extract(const dat::Document& doc);

  /********** run() ***************************************/
  /* Every latest Document (of topic, if given) in url order. Per document
   * failures are counted, StoreConflict propagates
   */
  ExtractSummary run(const std::optional<std::string>& topic = std::nullopt);

private:
  dat::ContentStore& store_;
  ExtractConfig cfg_;
  svc::AssistService* assist_;
  bool assist_ready_{false};

  void fill_with_assist_(const dat::Document& doc, dat::Record& rec) const;
};

} // end namespace xtr

#endif // !__CTXPIPE_EXTRACTOR_HPP
