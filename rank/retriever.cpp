/*
 * retriever.cpp  Andrew Belles  Nov 26th, 2025
 *
 */

#include "ctxpipe/rank/retriever.hpp"
#include "ctxpipe/logging.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<rnk::Provenance, const char*>, 3> kSections{{
  {rnk::Provenance::Entity,   "=== VISA PROGRAMS ==="},
  {rnk::Provenance::General,  "=== GENERAL INFORMATION ==="},
  {rnk::Provenance::Document, "=== DOCUMENT EXCERPTS ==="},
}};

constexpr std::string_view kEntrySep   = "\n---\n";
constexpr std::string_view kSectionSep = "\n\n";

static const char*
section_header_(rnk::Provenance p)
{
  for (const auto& [prov, header] : kSections) {
    if ( prov == p ) {
      return header;
    }
  }
  return kSections[0].second;
}

static bool
has_phrase_(const std::string& padded_query, const std::string& phrase)
{
  const auto norm = dat::normalize_name(phrase);
  if ( norm.empty() ) {
    return false;
  }
  return padded_query.find(" " + norm + " ") != std::string::npos;
}

static std::string
json_text_(const boost::json::value& v)
{
  if ( v.is_string() ) {
    return std::string(v.as_string().c_str());
  }
  return boost::json::serialize(v);
}

static std::string
join_(const std::vector<std::string>& items, std::string_view sep)
{
  std::string out;
  for (const auto& s : items) {
    if ( !out.empty() ) {
      out += sep;
    }
    out += s;
  }
  return out;
}

// cut at n bytes without splitting a utf-8 sequence
static std::string
utf8_prefix_(const std::string& s, size_t n)
{
  if ( n >= s.size() ) {
    return s;
  }
  while ( n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80 ) {
    n--;
  }
  return s.substr(0, n);
}

static std::string
requirement_lines_(const boost::json::object& fields)
{
  std::string out;
  auto line = [&out](const std::string& s) { out += "- " + s + "\n"; };

  const auto* lo = fields.if_contains("age_min");
  const auto* hi = fields.if_contains("age_max");
  if ( lo && hi ) {
    line("Age " + json_text_(*lo) + "-" + json_text_(*hi));
  } else if ( lo ) {
    line("Age " + json_text_(*lo) + "+");
  } else if ( hi ) {
    line("Age under " + json_text_(*hi));
  }

  const std::array<std::pair<const char*, const char*>, 5> labeled{{
    {"education", "Education: "},
    {"experience_years", "Experience (years): "},
    {"language", "Language: "},
    {"application_fee", "Application fee: "},
    {"processing_time", "Processing time: "},
  }};
  for (const auto& [key, label] : labeled) {
    if ( const auto* v = fields.if_contains(key) ) {
      line(label + json_text_(*v));
    }
  }

  // anything else the record carries, by key
  for (const auto& kv : fields) {
    const std::string key(kv.key());
    const bool known = key == "age_min" || key == "age_max" ||
                       std::any_of(labeled.begin(), labeled.end(),
                                   [&](const auto& p) { return key == p.first; });
    if ( !known ) {
      line(key + ": " + json_text_(kv.value()));
    }
  }
  return out;
}

}

namespace rnk {

std::map<std::string, std::string>
default_topic_aliases()
{
  return {
    {"united kingdom", "uk"},
    {"great britain", "uk"},
    {"britain", "uk"},
    {"england", "uk"},
    {"united arab emirates", "uae"},
    {"emirates", "uae"},
    {"dubai", "uae"},
    {"united states", "usa"},
    {"america", "usa"},
    {"us", "usa"},
    {"deutschland", "germany"},
    {"aussie", "australia"},
  };
}

std::vector<xtr::CategorySpec>
default_query_categories()
{
  return {
    {"work",     {"work", "job", "employment", "skilled", "worker"}},
    {"study",    {"study", "student", "education", "university"}},
    {"family",   {"family", "spouse", "partner", "dependent"}},
    {"business", {"business", "investor", "entrepreneur"}},
    {"tourist",  {"tourist", "visitor", "travel", "holiday"}},
  };
}

/************ assemble_bundle() ***************************/
/* The exact length of the rendered text is tracked while admitting, so the
 * budget check sees separators and section headers as well
 */
ContextBundle
assemble_bundle(std::vector<Candidate> ranked, size_t token_budget)
{
  ContextBundle bundle{};
  if ( ranked.empty() ) {
    return bundle;
  }

  const size_t budget = token_budget == 0 ? std::string::npos : token_budget * 4;

  struct Entry {
    Provenance prov;
    std::string text;
  };
  std::vector<Entry> entries;
  std::vector<Provenance> open;
  size_t used = 0;

  for (auto& c : ranked) {
    const bool new_section = std::find(open.begin(), open.end(), c.provenance) == open.end();
    const std::string header = section_header_(c.provenance);
    const std::string prefix = "[" + std::to_string(entries.size() + 1) + "] ";

    size_t overhead = prefix.size();
    if ( new_section ) {
      overhead += header.size() + 1 + (open.empty() ? 0 : kSectionSep.size());
    } else {
      overhead += kEntrySep.size();
    }

    std::string body = c.body;
    if ( used + overhead + body.size() > budget ) {
      if ( !entries.empty() ) {
        continue;
      }
      // first item always goes in, cut to what is left
      const size_t room = budget > overhead ? budget - overhead : 0;
      body = room > 3 ? utf8_prefix_(body, room - 3) + "..." : utf8_prefix_(body, room);
    }

    used += overhead + body.size();
    if ( new_section ) {
      open.push_back(c.provenance);
    }
    entries.push_back(Entry{c.provenance, prefix + body});

    for (const auto& url : c.source_urls) {
      const bool seen = std::any_of(bundle.citations.begin(), bundle.citations.end(),
                                    [&](const Citation& x) {
                                      return x.source_url == url && x.provenance == c.provenance;
                                    });
      if ( !seen ) {
        bundle.citations.push_back(Citation{url, c.provenance});
      }
    }

    const double score = c.score;
    bundle.items.push_back(BundleItem{std::move(c), score});
  }

  std::vector<std::string> sections;
  for (const auto& [prov, header] : kSections) {
    std::vector<std::string> blocks;
    for (const auto& e : entries) {
      if ( e.prov == prov ) {
        blocks.push_back(e.text);
      }
    }
    if ( !blocks.empty() ) {
      sections.push_back(std::string(header) + "\n" + join_(blocks, kEntrySep));
    }
  }
  bundle.text = join_(sections, kSectionSep);
  return bundle;
}

Retriever::Retriever(dat::ContentStore& store, RetrievalConfig cfg,
                     svc::EmbeddingService* embedder, svc::RerankService* reranker)
  : store_(store), cfg_(std::move(cfg))
{
  auto log = lgr::get("retrieve");

  if ( embedder && embedder->available() ) {
    tiers_.push_back(std::make_unique<HybridTier>(*embedder, cache_,
                                                  cfg_.semantic_weight, cfg_.keyword_weight));
  } else {
    log->info("no embedding service, keyword ranking only");
    tiers_.push_back(std::make_unique<KeywordTier>());
  }

  if ( reranker && reranker->available() ) {
    tiers_.push_back(std::make_unique<RerankTier>(*reranker, cfg_.rerank_pool));
  } else {
    log->info("no rerank service, first stage order is final");
  }
}

std::vector<std::string>
Retriever::tier_names() const
{
  std::vector<std::string> out;
  for (const auto& t : tiers_) {
    out.emplace_back(t->name());
  }
  return out;
}

Filters
Retriever::detect_filters(const std::string& query)
{
  const std::string padded = " " + dat::normalize_name(query) + " ";
  Filters f{};

  // longest phrase wins so "united kingdom" beats "kingdom"
  size_t best = 0;
  for (const auto& topic : store_.topics()) {
    if ( has_phrase_(padded, topic) && topic.size() > best ) {
      f.topic = topic;
      best = topic.size();
    }
  }
  for (const auto& [alias, topic] : cfg_.topic_aliases) {
    if ( has_phrase_(padded, alias) && alias.size() > best ) {
      f.topic = topic;
      best = alias.size();
    }
  }

  for (const auto& cat : cfg_.query_categories) {
    const bool hit = std::any_of(cat.keywords.begin(), cat.keywords.end(),
                                 [&](const std::string& kw) {
                                   return has_phrase_(padded, kw) || has_phrase_(padded, kw + "s");
                                 });
    if ( hit ) {
      f.category = cat.name;
      break;
    }
  }
  return f;
}

Candidate
Retriever::from_record_(const dat::Record& rec) const
{
  Candidate c{};
  c.id          = rec.key;
  c.provenance  = rec.kind == dat::RecordKind::Entity ? Provenance::Entity : Provenance::General;
  c.topic       = rec.topic;
  c.category    = rec.category;
  c.title       = rec.name;
  c.source_urls = rec.source_urls;
  c.updated_at  = rec.updated_at;

  std::string text = rec.name + "\n" + rec.topic + " " + rec.category + "\n";
  for (const auto& kv : rec.fields) {
    text += std::string(kv.key()) + " " + json_text_(kv.value()) + "\n";
  }
  text += rec.summary + "\n" + join_(rec.key_points, "\n");
  c.text = std::move(text);

  const std::string sources = "Sources: " + join_(rec.source_urls, ", ") +
                              " (" + std::string(to_string(c.provenance)) + ")";
  if ( c.provenance == Provenance::Entity ) {
    std::string body = rec.name + " (" + rec.topic + ", " + rec.category + ")\n";
    const auto reqs = requirement_lines_(rec.fields);
    if ( !reqs.empty() ) {
      body += "Requirements:\n" + reqs;
    }
    c.body = body + sources;
  } else {
    std::string body = rec.name + " (" + rec.topic + ")\n";
    if ( !rec.summary.empty() ) {
      body += "Summary: " + rec.summary + "\n";
    }
    if ( !rec.key_points.empty() ) {
      body += "Key points:\n";
      for (const auto& p : rec.key_points) {
        body += "- " + p + "\n";
      }
    }
    c.body = body + sources;
  }
  return c;
}

Candidate
Retriever::from_document_(const dat::Document& doc) const
{
  Candidate c{};
  c.id          = doc.url;
  c.provenance  = Provenance::Document;
  c.topic       = doc.topic;
  c.title       = doc.title;
  c.text        = doc.title + "\n" + doc.topic + "\n" + doc.content_text;
  c.source_urls = {doc.url};
  c.updated_at  = doc.fetched_at;

  std::string excerpt = utf8_prefix_(doc.content_text, cfg_.excerpt_chars);
  if ( excerpt.size() < doc.content_text.size() ) {
    excerpt += "...";
  }
  c.body = doc.title + " (" + doc.topic + ")\n" + excerpt + "\nSource: " + doc.url + " (document)";
  return c;
}

std::vector<Candidate>
Retriever::candidates_(const Filters& f)
{
  std::vector<Candidate> out;
  for (const auto& rec : store_.get_latest_records(f.topic, f.category)) {
    out.push_back(from_record_(rec));
  }

  // documents carry no category, a category filter excludes them
  if ( cfg_.include_documents && !f.category ) {
    for (const auto& doc : store_.get_latest_documents(f.topic)) {
      out.push_back(from_document_(doc));
    }
  }
  return out;
}

/************ Retriever::retrieve *************************/
/* Explicit filters are binding, a filter that matches nothing gives an
 * empty bundle. Detected filters are a hint and are dropped again when
 * they leave no candidates
 */
ContextBundle
Retriever::retrieve(const std::string& query, const std::optional<std::string>& topic,
                    const std::optional<std::string>& category, size_t max_items)
{
  auto log = lgr::get("retrieve");
  const size_t k = max_items ? max_items : cfg_.max_items;

  Filters explicit_f{topic, category};
  Filters f = explicit_f;
  if ( !f.topic || !f.category ) {
    auto detected = detect_filters(query);
    if ( !f.topic ) {
      f.topic = std::move(detected.topic);
    }
    if ( !f.category ) {
      f.category = std::move(detected.category);
    }
  }

  log->debug("query '{}' topic={} category={}", query,
             f.topic.value_or("*"), f.category.value_or("*"));

  auto cands = candidates_(f);
  if ( cands.empty() && (f.topic != explicit_f.topic || f.category != explicit_f.category) ) {
    log->debug("detected filters match nothing, widening");
    cands = candidates_(explicit_f);
  }
  if ( cands.empty() ) {
    log->info("no candidates for '{}'", query);
    return ContextBundle{};
  }

  const size_t pool = cands.size();
  for (auto& tier : tiers_) {
    cands = tier->rank(query, std::move(cands), k);
  }
  if ( cands.size() > k ) {
    cands.resize(k);
  }

  auto bundle = assemble_bundle(std::move(cands), cfg_.token_budget);
  log->info("'{}': {} candidate(s), {} item(s) in bundle, {} chars",
            query, pool, bundle.items.size(), bundle.text.size());
  return bundle;
}

}
