/*
 * html.hpp  Andrew Belles  Nov 18th, 2025
 *
 * HTML to page conversion shared by both fetch strategies. Wraps the
 * libxml2 recovering HTML parser
 *
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace htm {

struct HtmlPage {
  std::string title;
  std::string text;                 // visible text, one block per line
  std::vector<std::string> links;   // absolute http(s) targets, first-seen order, no duplicates
};

/************ parse_html() ********************************/
/* Extracts title, visible text and outbound links from raw markup.
 * Boilerplate containers (script, style, noscript, nav, header, footer,
 * aside, form) are skipped. Links are resolved against base_url.
 *
 * Never throws for malformed markup, an unparseable document yields an
 * empty page
 */
HtmlPage parse_html(std::string_view raw, const std::string& base_url);

// Collapses runs of whitespace to single spaces and trims
std::string collapse_ws(std::string_view text);

}
