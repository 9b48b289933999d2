/*
 * rules.cpp  Andrew Belles  Nov 24th, 2025
 *
 * Category vocabulary, field rule table and the general content helpers
 *
 */

#include "ctxpipe/extract/rules.hpp"
#include "ctxpipe/crawler/crawler_support.hpp"
#include "ctxpipe/crawler/html.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

namespace json = boost::json;

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// multi byte punctuation spelled out so the patterns stay ascii
const std::string kDash     = "(?:-|\xE2\x80\x93|to)";
const std::string kApos     = "(?:'|\xE2\x80\x99)";
const std::string kCurrency = "(\\$|\xC2\xA3|\xE2\x82\xAC|aud|usd|cad|nzd|gbp|eur)\\s?"
                              "(\\d{1,3}(?:,\\d{3})+|\\d+)(?:\\.\\d{2})?";
const std::string kUnit     = "(days?|weeks?|months?)";

static int64_t
int_of_(const std::ssub_match& m)
{
  return std::strtoll(m.str().c_str(), nullptr, 10);
}

static std::optional<json::value>
int_group_(const std::smatch& m, size_t group)
{
  if ( !m[group].matched ) {
    return std::nullopt;
  }
  return json::value(int_of_(m[group]));
}

static std::string
unit_plural_(std::string unit)
{
  unit = crwl::to_lower(unit);
  if ( unit.back() != 's' ) {
    unit.push_back('s');
  }
  return unit;
}

static std::string
strip_commas_(const std::string& s)
{
  std::string out;
  for (char c : s) {
    if ( c != ',' ) {
      out.push_back(c);
    }
  }
  return out;
}

static std::string
fee_string_(const std::string& currency, const std::string& amount)
{
  std::string cur = currency;
  if ( cur.size() == 3 && std::isalpha(static_cast<unsigned char>(cur[0])) ) {
    std::transform(cur.begin(), cur.end(), cur.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    cur.push_back(' ');
  }
  return cur + strip_commas_(amount);
}

static std::optional<json::value>
fee_from_(const std::smatch& m, size_t cur_group, size_t amount_group)
{
  return json::value(fee_string_(m[cur_group].str(), m[amount_group].str()));
}

static std::optional<json::value>
constant_(const char* value)
{
  return json::value(value);
}

// finite and small enough that the cast to int64_t is defined
static bool
integral_double_(double d)
{
  return std::isfinite(d) && std::fabs(d) < 9.0e18;
}

static std::optional<int64_t>
as_int_(const json::value& v)
{
  if ( v.is_int64() ) {
    return v.as_int64();
  }
  if ( v.is_uint64() ) {
    if ( v.as_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ) {
      return std::nullopt;
    }
    return static_cast<int64_t>(v.as_uint64());
  }
  if ( v.is_double() ) {
    const double d = v.as_double();
    if ( !integral_double_(d) ) {
      return std::nullopt;
    }
    if ( d == static_cast<double>(static_cast<int64_t>(d)) ) {
      return static_cast<int64_t>(d);
    }
    return std::nullopt;
  }
  if ( v.is_string() ) {
    const std::string s(v.as_string().c_str());
    static const std::regex digits(R"(^\s*(\d{1,4})\s*$)");
    std::smatch m;
    if ( std::regex_match(s, m, digits) ) {
      return int_of_(m[1]);
    }
  }
  return std::nullopt;
}

static std::optional<json::value>
int_in_range_(const json::value& v, int64_t lo, int64_t hi)
{
  auto n = as_int_(v);
  if ( !n || *n < lo || *n > hi ) {
    return std::nullopt;
  }
  return json::value(*n);
}

static std::optional<json::value>
coerce_fee_(const json::value& v)
{
  std::string text;
  if ( v.is_int64() || v.is_uint64() ) {
    text = "$" + (v.is_int64() ? std::to_string(v.get_int64()) : std::to_string(v.get_uint64()));
  } else if ( v.is_double() ) {
    if ( !integral_double_(v.get_double()) ) {
      return std::nullopt;
    }
    text = "$" + std::to_string(static_cast<int64_t>(v.get_double()));
  } else if ( v.is_string() ) {
    text = v.as_string().c_str();
  } else {
    return std::nullopt;
  }

  static const std::regex with_currency("^\\s*" + kCurrency + "\\s*$", kIcase);
  static const std::regex bare(R"(^\s*(\d{1,3}(?:,\d{3})+|\d+)(?:\.\d{2})?\s*$)");
  std::smatch m;
  std::string out;
  if ( std::regex_match(text, m, with_currency) ) {
    out = fee_string_(m[1].str(), m[2].str());
  } else if ( std::regex_match(text, m, bare) ) {
    out = "$" + strip_commas_(m[1].str());
  } else {
    return std::nullopt;
  }

  const auto digits = out.find_first_of("0123456789");
  const auto amount = std::strtoll(out.c_str() + digits, nullptr, 10);
  if ( amount < 1 || amount > 100000 ) {
    return std::nullopt;
  }
  return json::value(out);
}

static std::optional<json::value>
coerce_processing_(const json::value& v)
{
  if ( !v.is_string() ) {
    return std::nullopt;
  }
  const std::string text(v.as_string().c_str());
  static const std::regex shape("^\\s*(\\d{1,3})(?:\\s*" + kDash + "\\s*(\\d{1,3}))?\\s*" +
                                kUnit + "\\s*$", kIcase);
  std::smatch m;
  if ( !std::regex_match(text, m, shape) ) {
    return std::nullopt;
  }

  const int64_t lo = int_of_(m[1]);
  const int64_t hi = m[2].matched ? int_of_(m[2]) : lo;
  const std::string unit = unit_plural_(m[3].str());
  const int64_t days_per = unit == "days" ? 1 : unit == "weeks" ? 7 : 30;
  if ( lo < 1 || hi < lo || hi * days_per > 1095 ) {
    return std::nullopt;
  }

  if ( m[2].matched && hi != lo ) {
    return json::value(std::to_string(lo) + "-" + std::to_string(hi) + " " + unit);
  }
  return json::value(std::to_string(lo) + " " + unit);
}

static std::optional<json::value>
coerce_language_(const json::value& v)
{
  if ( !v.is_string() ) {
    return std::nullopt;
  }
  const std::string text(v.as_string().c_str());
  static const std::regex shape(R"(^\s*(ielts|toefl|pte)\b[^\d]{0,30}(\d{1,3}(?:\.\d)?)\s*$)", kIcase);
  std::smatch m;
  if ( !std::regex_match(text, m, shape) ) {
    return std::nullopt;
  }

  std::string test = m[1].str();
  std::transform(test.begin(), test.end(), test.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const double score = std::strtod(m[2].str().c_str(), nullptr);

  double lo = 1.0, hi = 9.0;
  if ( test == "TOEFL" ) {
    lo = 0.0; hi = 120.0;
  } else if ( test == "PTE" ) {
    lo = 10.0; hi = 90.0;
  }
  if ( score < lo || score > hi ) {
    return std::nullopt;
  }
  return json::value(test + " " + m[2].str());
}

static std::optional<json::value>
coerce_education_(const json::value& v)
{
  if ( !v.is_string() ) {
    return std::nullopt;
  }
  const auto level = crwl::to_lower(v.as_string().c_str());
  for (const char* known : {"phd", "masters", "bachelors", "diploma", "secondary"}) {
    if ( level == known ) {
      return json::value(known);
    }
  }
  return std::nullopt;
}

static std::vector<xtr::FieldRule>
build_rules_()
{
  using xtr::FieldRule;
  std::vector<FieldRule> rules;

  auto add = [&rules](const char* field, const std::string& pattern,
                      std::function<std::optional<json::value>(const std::smatch&)> convert) {
    rules.push_back(FieldRule{field, std::regex(pattern, kIcase), std::move(convert)});
  };

  const std::string age_range  = "\\bage[ds]?\\s+(?:between\\s+|of\\s+|from\\s+)?(\\d{1,2})\\s*"
                                 "(?:-|\xE2\x80\x93|to|and)\\s*(\\d{1,2})\\b";
  const std::string age_betw   = R"(\bbetween\s+(\d{1,2})\s+and\s+(\d{1,2})\s+years?\s+(?:of\s+age|old)\b)";

  // age_min
  add("age_min", age_range, [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_min", age_betw,  [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_min", R"(\b(?:be|aged?)\s+(?:at\s+least|over|above|older\s+than)\s+(\d{1,2})\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_min", R"(\bat\s+least\s+(\d{1,2})\s+years?\s+(?:of\s+age|old)\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_min", R"(\b(\d{1,2})\s+years?\s+(?:of\s+age\s+)?or\s+older\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_min", R"(\bminimum\s+age\s+(?:of\s+|is\s+)?(\d{1,2})\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });

  // age_max
  add("age_max", age_range, [](const std::smatch& m) { return int_group_(m, 2); });
  add("age_max", age_betw,  [](const std::smatch& m) { return int_group_(m, 2); });
  add("age_max", R"(\b(?:be|aged?)\s+(?:under|below|younger\s+than|less\s+than)\s+(\d{1,2})\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_max", R"(\b(?:under|below|younger\s+than)\s+(\d{1,2})\s+years?\s+(?:of\s+age|old)\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("age_max", R"(\bmaximum\s+age\s+(?:of\s+|is\s+)?(\d{1,2})\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });

  // education, highest level first
  add("education", R"(\b(?:ph\.?\s?d|doctorate|doctoral\s+degree)\b)",
      [](const std::smatch&) { return constant_("phd"); });
  add("education", "\\bmaster" + kApos + "?s\\b|\\bmaster\\s+degree\\b",
      [](const std::smatch&) { return constant_("masters"); });
  add("education", "\\bbachelor" + kApos + "?s\\b|\\bbachelor\\s+degree\\b|"
                   "\\bdegree\\s+qualification\\b|\\bundergraduate\\s+degree\\b",
      [](const std::smatch&) { return constant_("bachelors"); });
  add("education", R"(\bdiploma\b)",
      [](const std::smatch&) { return constant_("diploma"); });
  add("education", R"(\bsecondary\s+(?:education|school)\b|\bhigh\s+school\b)",
      [](const std::smatch&) { return constant_("secondary"); });

  // experience_years
  add("experience_years",
      "\\b(\\d{1,2})\\+?\\s*(?:or\\s+more\\s+)?years?" + kApos + "?\\s+(?:of\\s+)?"
      "(?:(?:relevant|full[- ]time|paid|professional|skilled|work|post-qualification)\\s+)*"
      "experience\\b",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("experience_years", R"(\bexperience\s+of\s+(?:at\s+least\s+)?(\d{1,2})\s+years?\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });
  add("experience_years", R"(\bminimum\s+(?:of\s+)?(\d{1,2})\s+years?\b[^.]{0,40}\bexperience\b)",
      [](const std::smatch& m) { return int_group_(m, 1); });

  // application_fee
  add("application_fee",
      R"(\b(?:application|visa|lodgement|base)\s+(?:fee|charge|cost)s?\b[^.]{0,60}?)" + kCurrency,
      [](const std::smatch& m) { return fee_from_(m, 1, 2); });
  add("application_fee",
      kCurrency + R"(\s+(?:application|visa|lodgement)\s+fee\b)",
      [](const std::smatch& m) { return fee_from_(m, 1, 2); });
  add("application_fee", R"(\bfees?\b[^.]{0,60}?)" + kCurrency,
      [](const std::smatch& m) { return fee_from_(m, 1, 2); });

  // processing_time, ranges before single values
  auto range = [](const std::smatch& m) -> std::optional<json::value> {
    return json::value(m[1].str() + "-" + m[2].str() + " " + unit_plural_(m[3].str()));
  };
  auto single = [](const std::smatch& m) -> std::optional<json::value> {
    return json::value(m[1].str() + " " + unit_plural_(m[2].str()));
  };
  add("processing_time",
      "\\bprocessing\\s+times?\\b[^.\\d]{0,40}(\\d{1,3})\\s*" + kDash + "\\s*(\\d{1,3})\\s*" + kUnit,
      range);
  add("processing_time",
      "\\b(?:processed|decided|decision)\\s+(?:with)?in\\s+(\\d{1,3})\\s*" + kDash +
      "\\s*(\\d{1,3})\\s*" + kUnit,
      range);
  add("processing_time", "\\bprocessing\\s+times?\\b[^.\\d]{0,40}(\\d{1,3})\\s*" + kUnit, single);
  add("processing_time",
      "\\b(?:processed|decided|decision)\\s+(?:with)?in\\s+(\\d{1,3})\\s*" + kUnit,
      single);

  // language
  add("language",
      R"(\b(ielts|toefl|pte)\b(?:\s+(?:academic|ibt|general))?[^.\d]{0,40}(\d{1,3}(?:\.\d)?))",
      [](const std::smatch& m) -> std::optional<json::value> {
        return json::value(m[1].str() + " " + m[2].str());
      });
  add("language",
      R"(\b(?:score|band)\s+of\s+(\d{1,3}(?:\.\d)?)[^.]{0,30}\b(ielts|toefl|pte)\b)",
      [](const std::smatch& m) -> std::optional<json::value> {
        return json::value(m[2].str() + " " + m[1].str());
      });

  return rules;
}

}

namespace xtr {

std::vector<CategorySpec>
default_categories()
{
  return {
    {"work",     {"work", "job", "employment", "employer", "skilled", "worker",
                  "occupation", "work permit", "labour market", "sponsorship"}},
    {"study",    {"study", "student", "education", "university", "tuition",
                  "enrol", "course", "scholarship", "college"}},
    {"family",   {"family", "spouse", "partner", "dependent", "dependant",
                  "child", "parent", "relative", "marriage"}},
    {"business", {"business", "investor", "investment", "entrepreneur",
                  "startup", "start-up", "capital", "company"}},
    {"tourist",  {"tourist", "visitor", "travel", "holiday", "tourism",
                  "sightseeing", "vacation"}},
  };
}

std::vector<std::string>
default_general_markers()
{
  return {"guide", "faq", "frequently asked", "overview", "how to", "introduction",
          "step by step", "checklist", "tips", "explained", "what you need to know",
          "general information"};
}

size_t
count_occurrences(std::string_view lowered, std::string_view keyword)
{
  if ( keyword.empty() ) {
    return 0;
  }

  size_t hits = 0;
  for (size_t pos = lowered.find(keyword); pos != std::string_view::npos;
       pos = lowered.find(keyword, pos + 1)) {
    if ( pos == 0 || !std::isalnum(static_cast<unsigned char>(lowered[pos - 1])) ) {
      hits++;
    }
  }
  return hits;
}

/************ classify() **********************************/
/* Best category: most distinct keywords, then most occurrences, then the
 * earliest in configuration order. Entity beats general on equal counts
 */
std::optional<Classification>
classify(std::string_view title, std::string_view text, const ExtractConfig& cfg)
{
  std::string hay = crwl::to_lower(title);
  hay.push_back('\n');
  hay += crwl::to_lower(text);

  Classification best{};
  for (const auto& cat : cfg.categories) {
    size_t matched = 0, occurrences = 0;
    for (const auto& kw : cat.keywords) {
      const size_t n = count_occurrences(hay, crwl::to_lower(kw));
      if ( n > 0 ) {
        matched++;
        occurrences += n;
      }
    }

    if ( matched > best.matched ||
         (matched == best.matched && occurrences > best.occurrences) ) {
      best.category    = cat.name;
      best.matched     = matched;
      best.occurrences = occurrences;
    }
  }

  for (const auto& marker : cfg.general_markers) {
    if ( count_occurrences(hay, crwl::to_lower(marker)) > 0 ) {
      best.general_hits++;
    }
  }

  const bool entity_ok  = best.matched > 0 && best.matched >= cfg.min_category_hits;
  const bool general_ok = best.general_hits > 0 && best.general_hits >= cfg.min_general_hits;
  if ( !entity_ok && !general_ok ) {
    return std::nullopt;
  }

  if ( entity_ok && (!general_ok || best.matched >= best.general_hits) ) {
    best.kind = dat::RecordKind::Entity;
  } else {
    best.kind = dat::RecordKind::General;
    if ( best.matched == 0 ) {
      best.category = "general";
    }
  }
  return best;
}

const std::vector<FieldRule>&
field_rules()
{
  static const std::vector<FieldRule> rules = build_rules_();
  return rules;
}

const std::vector<std::string>&
field_names()
{
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& r : field_rules()) {
      if ( std::find(out.begin(), out.end(), r.field) == out.end() ) {
        out.push_back(r.field);
      }
    }
    return out;
  }();
  return names;
}

std::optional<json::value>
coerce_field(std::string_view field, const json::value& value)
{
  if ( field == "age_min" || field == "age_max" ) {
    return int_in_range_(value, 14, 100);
  }
  if ( field == "experience_years" ) {
    return int_in_range_(value, 0, 40);
  }
  if ( field == "education" ) {
    return coerce_education_(value);
  }
  if ( field == "application_fee" ) {
    return coerce_fee_(value);
  }
  if ( field == "processing_time" ) {
    return coerce_processing_(value);
  }
  if ( field == "language" ) {
    return coerce_language_(value);
  }
  return std::nullopt;
}

/************ extract_fields() ****************************/
/* Runs the rule table over text. For every field the first rule that
 * matches with a value inside the sane range wins, matches that fail the
 * range check fall through to the next rule
 */
json::object
extract_fields(std::string_view text)
{
  const std::string subject(text);
  json::object out;

  for (const auto& rule : field_rules()) {
    if ( out.contains(rule.field) ) {
      continue;
    }

    std::smatch m;
    if ( !std::regex_search(subject, m, rule.pattern) ) {
      continue;
    }

    auto raw = rule.convert(m);
    if ( !raw ) {
      continue;
    }
    if ( auto value = coerce_field(rule.field, *raw) ) {
      out[rule.field] = std::move(*value);
    }
  }

  // a range that reads backwards is not a range
  const auto* lo = out.if_contains("age_min");
  const auto* hi = out.if_contains("age_max");
  if ( lo && hi && lo->as_int64() > hi->as_int64() ) {
    out.erase("age_max");
  }
  return out;
}

std::vector<std::string>
split_sentences(std::string_view text)
{
  std::vector<std::string> out;
  std::string current;

  auto flush = [&] {
    auto s = htm::collapse_ws(current);
    if ( !s.empty() ) {
      out.push_back(std::move(s));
    }
    current.clear();
  };

  for (size_t i{0}; i < text.size(); i++) {
    const char c = text[i];
    if ( c == '\n' ) {
      flush();
      continue;
    }
    current.push_back(c);
    if ( (c == '.' || c == '!' || c == '?') &&
         (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]))) ) {
      flush();
    }
  }
  flush();
  return out;
}

std::string
make_summary(std::string_view text, size_t max_chars)
{
  std::string summary;
  for (const auto& sentence : split_sentences(text)) {
    const size_t extra = summary.empty() ? sentence.size() : sentence.size() + 1;
    if ( summary.size() + extra > max_chars ) {
      if ( summary.empty() ) {
        // one long opening sentence, cut on a word boundary
        auto cut = sentence.rfind(' ', max_chars);
        if ( cut == std::string::npos || cut == 0 ) {
          cut = max_chars;
        }
        summary = sentence.substr(0, cut) + "...";
      }
      break;
    }
    if ( !summary.empty() ) {
      summary.push_back(' ');
    }
    summary += sentence;
  }
  return summary;
}

std::vector<std::string>
key_points(std::string_view text, const ExtractConfig& cfg)
{
  std::vector<std::string> vocab;
  for (const auto& m : cfg.general_markers) {
    vocab.push_back(crwl::to_lower(m));
  }
  for (const auto& cat : cfg.categories) {
    for (const auto& kw : cat.keywords) {
      vocab.push_back(crwl::to_lower(kw));
    }
  }

  std::vector<std::string> points;
  for (auto& sentence : split_sentences(text)) {
    if ( points.size() >= cfg.max_key_points ) {
      break;
    }
    if ( sentence.size() < 20 || sentence.size() > 300 ) {
      continue;
    }

    const auto lowered = crwl::to_lower(sentence);
    const bool marked = std::any_of(vocab.begin(), vocab.end(), [&](const std::string& kw) {
      return count_occurrences(lowered, kw) > 0;
    });
    if ( marked && std::find(points.begin(), points.end(), sentence) == points.end() ) {
      points.push_back(std::move(sentence));
    }
  }
  return points;
}

std::string
entity_name(std::string_view title, std::string_view text)
{
  std::string name = htm::collapse_ws(title);
  for (const char* sep : {" | ", " - ", " \xE2\x80\x93 ", " \xE2\x80\x94 ", " :: "}) {
    const auto pos = name.find(sep);
    if ( pos != std::string::npos && pos > 0 ) {
      name.erase(pos);
    }
  }

  if ( name.empty() ) {
    auto sentences = split_sentences(text);
    if ( !sentences.empty() ) {
      name = sentences.front().substr(0, 80);
    }
  }
  return name;
}

}
