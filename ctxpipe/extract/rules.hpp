/*
 * rules.hpp  Andrew Belles  Nov 24th, 2025
 *
 * Classification vocabulary and the ordered field rules used by the
 * Extractor. Everything here is pure, no store and no services
 *
 */

#ifndef __CTXPIPE_RULES_HPP
#define __CTXPIPE_RULES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "ctxpipe/store/model.hpp"

namespace xtr {

namespace json = boost::json;

struct CategorySpec {
  std::string name;
  std::vector<std::string> keywords;
};

std::vector<CategorySpec> default_categories();
std::vector<std::string> default_general_markers();

struct ExtractConfig {
  std::vector<CategorySpec> categories{default_categories()};
  std::vector<std::string> general_markers{default_general_markers()};
  size_t min_category_hits{2};
  size_t min_general_hits{2};
  size_t summary_chars{400};
  size_t max_key_points{5};
  size_t assist_chars{8000};        // text handed to the assist service
};

/************ Classification ******************************/

struct Classification {
  dat::RecordKind kind{dat::RecordKind::Entity};
  std::string category;
  size_t matched{0};                // distinct category keywords found
  size_t occurrences{0};            // total category keyword occurrences
  size_t general_hits{0};           // distinct general markers found
};

/************ classify() **********************************/
/* Scores title + text against every category and the general markers.
 *
 * We return:
 *   nullopt if neither the best category nor the general markers reach
 *   their minimum, the winning classification otherwise
 */
std::optional<Classification> classify(std::string_view title, std::string_view text,
                                       const ExtractConfig& cfg);

// Occurrences of keyword in lowered text that start on a word boundary
size_t count_occurrences(std::string_view lowered, std::string_view keyword);

/************ FieldRule ***********************************/
/* One pattern for one field. Rules are tried in table order and the first
 * rule that yields a valid value for a field wins
 */
struct FieldRule {
  std::string field;
  std::regex pattern;
  std::function<std::optional<json::value>(const std::smatch&)> convert;
};

const std::vector<FieldRule>& field_rules();

// Names of every field the rules know about, in table order
const std::vector<std::string>& field_names();

/************ coerce_field() ******************************/
/* Normalizes a candidate value and applies the sanity range for field.
 * Shared by the rules and the assist reply check.
 *
 * We return:
 *   the normalized value, or nullopt when the value is out of range, of
 *   the wrong shape, or the field is unknown
 */
std::optional<json::value> coerce_field(std::string_view field, const json::value& value);

json::object extract_fields(std::string_view text);

/************ general content *****************************/

std::vector<std::string> split_sentences(std::string_view text);

std::string make_summary(std::string_view text, size_t max_chars);

std::vector<std::string> key_points(std::string_view text, const ExtractConfig& cfg);

// Display name for a document: leading title segment before a site suffix
std::string entity_name(std::string_view title, std::string_view text);

} // end namespace xtr

#endif // !__CTXPIPE_RULES_HPP
