/*
 * extractor.cpp  Andrew Belles  Nov 24th, 2025
 *
 */

#include "ctxpipe/extract/extractor.hpp"
#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/logging.hpp"

#include <algorithm>

namespace {

template <class T>
static bool
append_unseen_(std::vector<T>& into, const std::vector<T>& from)
{
  bool changed = false;
  for (const auto& item : from) {
    if ( std::find(into.begin(), into.end(), item) == into.end() ) {
      into.push_back(item);
      changed = true;
    }
  }
  return changed;
}

/************ assist_prompt_() ****************************/
/* Prompt listing only the fields still missing, with the value shapes the
 * range checks accept
 */
static std::string
assist_prompt_(const dat::Document& doc, const std::vector<std::string>& missing,
               size_t max_chars)
{
  std::string fields;
  for (const auto& f : missing) {
    if ( !fields.empty() ) {
      fields += ", ";
    }
    fields += "\"" + f + "\"";
  }

  std::string prompt =
    "Extract visa or immigration program requirements from this web page.\n"
    "Topic: " + doc.topic + "\n"
    "Title: " + doc.title + "\n\n"
    "Content:\n" + doc.content_text.substr(0, max_chars) + "\n\n"
    "Return ONLY a JSON object with these keys: " + fields + ".\n"
    "Shapes: age_min/age_max/experience_years integers, education one of "
    "phd|masters|bachelors|diploma|secondary, application_fee like \"$100\", "
    "processing_time like \"3-6 months\", language like \"IELTS 6.5\".\n"
    "Use null for anything the page does not state. Do not guess.";
  return prompt;
}

}

namespace xtr {

dat::Record
merge_records(const dat::Record& current, const dat::Record& incoming)
{
  dat::Record merged = current;

  for (const auto& kv : incoming.fields) {
    if ( !merged.fields.contains(kv.key()) ) {
      merged.fields[kv.key()] = kv.value();
    }
  }

  if ( merged.summary.empty() ) {
    merged.summary = incoming.summary;
  }
  if ( merged.category.empty() || merged.category == "general" ) {
    if ( !incoming.category.empty() ) {
      merged.category = incoming.category;
    }
  }

  append_unseen_(merged.key_points, incoming.key_points);
  append_unseen_(merged.source_urls, incoming.source_urls);
  return merged;
}

bool
same_content(const dat::Record& a, const dat::Record& b)
{
  return a.key == b.key && a.kind == b.kind && a.topic == b.topic &&
         a.category == b.category && a.name == b.name && a.fields == b.fields &&
         a.summary == b.summary && a.key_points == b.key_points &&
         a.source_urls == b.source_urls;
}

Extractor::Extractor(dat::ContentStore& store, ExtractConfig cfg, svc::AssistService* assist)
  : store_(store), cfg_(std::move(cfg)), assist_(assist)
{
  assist_ready_ = assist_ && assist_->available();
  if ( assist_ && !assist_ready_ ) {
    lgr::get("extract")->info("assist service unavailable, rule extraction only");
  }
}

std::optional<dat::Record>
Extractor::extract(const dat::Document& doc) const
{
  auto log = lgr::get("extract");

  const auto cls = classify(doc.title, doc.content_text, cfg_);
  if ( !cls ) {
    log->debug("low confidence, skipping {}", doc.url);
    return std::nullopt;
  }

  dat::Record rec{};
  rec.kind        = cls->kind;
  rec.topic       = doc.topic;
  rec.category    = cls->category;
  rec.name        = entity_name(doc.title, doc.content_text);
  rec.key         = dat::make_record_key(rec.name, doc.topic);
  rec.source_urls = {doc.url};

  if ( rec.name.empty() || rec.key.front() == '|' ) {
    log->debug("no usable name for {}, skipping", doc.url);
    return std::nullopt;
  }

  if ( rec.kind == dat::RecordKind::Entity ) {
    rec.fields = extract_fields(doc.content_text);
    if ( assist_ready_ ) {
      fill_with_assist_(doc, rec);
    }
  } else {
    rec.summary    = make_summary(doc.content_text, cfg_.summary_chars);
    rec.key_points = key_points(doc.content_text, cfg_);
  }

  log->debug("{} -> {} '{}' ({}, {} field(s))", doc.url, dat::to_string(rec.kind),
             rec.name, rec.category, rec.fields.size());
  return rec;
}

/************ fill_with_assist_() *************************/
/* Asks the assist service for fields the rules left empty. Replies are
 * run through coerce_field like rule output, anything malformed is dropped
 */
void
Extractor::fill_with_assist_(const dat::Document& doc, dat::Record& rec) const
{
  auto log = lgr::get("extract");

  std::vector<std::string> missing;
  for (const auto& f : field_names()) {
    if ( !rec.fields.contains(f) ) {
      missing.push_back(f);
    }
  }
  if ( missing.empty() ) {
    return;
  }

  std::string reply;
  try {
    reply = assist_->complete(assist_prompt_(doc, missing, cfg_.assist_chars));
  } catch (const svc::ServiceError& e) {
    log->warn("assist failed for {}: {}", doc.url, e.what());
    return;
  }

  const auto body = svc::strip_json_reply(reply);
  if ( body.empty() ) {
    log->debug("assist reply for {} carries no json", doc.url);
    return;
  }

  boost::json::value parsed;
  try {
    parsed = jsc::parse(body);
  } catch (const std::runtime_error& e) {
    log->debug("assist reply for {} rejected: {}", doc.url, e.what());
    return;
  }
  if ( !parsed.is_object() ) {
    return;
  }

  size_t filled = 0;
  for (const auto& f : missing) {
    const auto* v = parsed.as_object().if_contains(f);
    if ( !v || v->is_null() ) {
      continue;
    }
    if ( auto value = coerce_field(f, *v) ) {
      rec.fields[f] = std::move(*value);
      filled++;
    }
  }
  log->debug("assist filled {} of {} missing field(s) for {}", filled, missing.size(), doc.url);
}

std::optional<dat::Record>
Extractor::classify_and_extract(const dat::Document& doc)
{
  auto candidate = extract(doc);
  if ( !candidate ) {
    return std::nullopt;
  }

  auto current = store_.get_latest_record(candidate->key);
  dat::Record next = current ? merge_records(*current, *candidate) : *candidate;

  if ( current && same_content(*current, next) ) {
    lgr::get("extract")->debug("{} unchanged by {}", current->key, doc.url);
    return current;
  }

  const int64_t expected = current ? current->version : 0;
  store_.put_record(next, expected);
  return store_.get_latest_record(next.key);
}

ExtractSummary
Extractor::run(const std::optional<std::string>& topic)
{
  auto log = lgr::get("extract");
  ExtractSummary summary{};

  const auto docs = store_.get_latest_documents(topic);
  log->info("extracting from {} document(s){}", docs.size(),
            topic ? " of topic " + *topic : std::string{});

  for (const auto& doc : docs) {
    summary.processed++;
    try {
      if ( classify_and_extract(doc) ) {
        summary.extracted++;
      } else {
        summary.skipped++;
      }
    } catch (const dat::StoreConflict&) {
      throw;
    } catch (const std::exception& e) {
      log->error("extraction failed for {}: {}", doc.url, e.what());
      summary.errors++;
    }
  }

  log->info("extraction done: processed {}, extracted {}, skipped {}, errors {}",
            summary.processed, summary.extracted, summary.skipped, summary.errors);
  return summary;
}

}
