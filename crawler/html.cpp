/*
 * html.cpp  Andrew Belles  Nov 18th, 2025
 *
 * libxml2 backed implementation of htm::parse_html
 *
 */

#include "ctxpipe/crawler/html.hpp"
#include "ctxpipe/crawler/http.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <cctype>
#include <memory>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace {

/************ XmlDocDeleter *******************************/
/* Frees a parsed document when the owning unique_ptr goes out of scope
 */
struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const noexcept
  {
    if ( doc ) {
      xmlFreeDoc(doc);
    }
  }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

static bool
tag_is_(const xmlNode* node, const char* name)
{
  return node->name && xmlStrcasecmp(node->name, BAD_CAST name) == 0;
}

static bool
is_skipped_(const xmlNode* node)
{
  static constexpr const char* skipped[] = {
    "script", "style", "noscript", "nav", "header",
    "footer", "aside", "form", "template", "svg", "iframe"
  };
  for (const char* name : skipped) {
    if ( tag_is_(node, name) ) {
      return true;
    }
  }
  return false;
}

static bool
is_block_(const xmlNode* node)
{
  static constexpr const char* blocks[] = {
    "p", "div", "section", "article", "main", "li", "ul", "ol", "table",
    "tr", "td", "th", "br", "h1", "h2", "h3", "h4", "h5", "h6",
    "dd", "dt", "blockquote", "pre"
  };
  for (const char* name : blocks) {
    if ( tag_is_(node, name) ) {
      return true;
    }
  }
  return false;
}

static std::string
prop_(xmlNode* node, const char* name)
{
  xmlChar* value = xmlGetProp(node, BAD_CAST name);
  if ( !value ) {
    return "";
  }
  std::string out(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return out;
}

static std::string
content_(xmlNode* node)
{
  xmlChar* value = xmlNodeGetContent(node);
  if ( !value ) {
    return "";
  }
  std::string out(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return out;
}

/************ Walker **************************************/
/* Single pass over the tree collecting text blocks and anchors
 */
class Walker {
public:
  explicit Walker(std::string base) : base_(std::move(base)) {}

  void walk(xmlNode* node)
  {
    for (xmlNode* cur = node; cur; cur = cur->next) {
      if ( cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE ) {
        if ( cur->content ) {
          line_.append(reinterpret_cast<const char*>(cur->content));
          line_.push_back(' ');
        }
        continue;
      }

      if ( cur->type != XML_ELEMENT_NODE ) {
        continue;
      }

      if ( tag_is_(cur, "title") ) {
        if ( page.title.empty() ) {
          page.title = htm::collapse_ws(content_(cur));
        }
        continue;
      }

      if ( tag_is_(cur, "base") ) {
        auto href = prop_(cur, "href");
        if ( !href.empty() ) {
          auto resolved = resolve_(href);
          if ( !resolved.empty() ) {
            base_ = std::move(resolved);
          }
        }
        continue;
      }

      if ( is_skipped_(cur) ) {
        continue;
      }

      if ( tag_is_(cur, "a") ) {
        add_link_(prop_(cur, "href"));
      }

      const bool block = is_block_(cur);
      if ( block ) {
        flush_();
      }
      walk(cur->children);
      if ( block ) {
        flush_();
      }
    }
  }

  void finish() { flush_(); }

  htm::HtmlPage page{};

private:
  std::string base_;
  std::string line_;
  std::unordered_set<std::string> seen_;

  void flush_()
  {
    auto text = htm::collapse_ws(line_);
    line_.clear();
    if ( text.empty() ) {
      return;
    }
    if ( !page.text.empty() ) {
      page.text.push_back('\n');
    }
    page.text += text;
  }

  std::string resolve_(const std::string& href) const
  {
    try {
      auto absolute = htc::resolve_url(base_, href);
      if ( absolute.empty() ) {
        return "";
      }
      return htc::normalize_url(absolute);
    } catch (const std::invalid_argument&) {
      return "";
    }
  }

  void add_link_(const std::string& href)
  {
    if ( href.empty() ) {
      return;
    }
    auto url = resolve_(href);
    if ( url.empty() ) {
      return;
    }
    if ( seen_.insert(url).second ) {
      page.links.push_back(std::move(url));
    }
  }
};

}

namespace htm {

std::string
collapse_ws(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (unsigned char c : text) {
    if ( std::isspace(c) ) {
      pending_space = !out.empty();
      continue;
    }
    if ( pending_space ) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(c));
  }
  return out;
}

HtmlPage
parse_html(std::string_view raw, const std::string& base_url)
{
  if ( raw.empty() ) {
    return {};
  }

  XmlDocPtr doc(htmlReadMemory(
    raw.data(),
    static_cast<int>(raw.size()),
    base_url.c_str(),
    "UTF-8",
    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
  ));

  if ( !doc ) {
    return {};
  }

  xmlNode* root = xmlDocGetRootElement(doc.get());
  if ( !root ) {
    return {};
  }

  Walker walker(base_url);
  walker.walk(root);
  walker.finish();
  return std::move(walker.page);
}

}
