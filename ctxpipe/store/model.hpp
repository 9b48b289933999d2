/*
 * model.hpp  Andrew Belles  Nov 20th, 2025
 *
 * Rows owned by the ContentStore. Documents are written by the Frontier,
 * Records by the extraction engine, both are read by retrieval
 *
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

namespace dat {

/************ Document ************************************/
/* One fetched page. url is the normalized url and the logical key
 */
struct Document {
  std::string url;
  std::string topic;
  std::string title;
  std::string content_text;
  std::string content_raw;
  std::vector<std::string> links;
  size_t depth{0};
  double relevance{0.0};
  int64_t fetched_at{0};            // unix ms
  int64_t version{0};               // assigned by the store
  bool is_latest{false};            // assigned by the store
};

enum class RecordKind : uint8_t {
  Entity,                           // one categorizable offering with typed fields
  General                           // guide / faq / overview with summary + key points
};

std::string_view to_string(RecordKind kind) noexcept;
std::optional<RecordKind> parse_kind(std::string_view name) noexcept;

/************ Record **************************************/
/* Entity derived from one or more Documents. key is stable across
 * versions: normalized name + "|" + topic
 */
struct Record {
  std::string key;
  RecordKind kind{RecordKind::Entity};
  std::string topic;
  std::string category;
  std::string name;
  boost::json::object fields;
  std::string summary;
  std::vector<std::string> key_points;
  std::vector<std::string> source_urls;
  int64_t version{0};               // assigned by the store
  bool is_latest{false};            // assigned by the store
  int64_t updated_at{0};            // unix ms, set by the store on write
};

// Lowercase, punctuation stripped, whitespace collapsed
std::string normalize_name(std::string_view name);
std::string make_record_key(std::string_view name, std::string_view topic);

int64_t now_ms() noexcept;

}
