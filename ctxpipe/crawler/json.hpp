/*
 * json.hpp  Andrew Belles  Nov 6th, 2025
 *
 * Definition of all json related helper functions that aim to simplfy
 * interacting with the boost/json external library. Shared by the config
 * loader, the content store (link/source lists, record fields) and the
 * service clients
 *
 */

#pragma once

#include <boost/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace jsc {

namespace json = boost::json;

inline json::value
parse(std::string_view body)
{
  boost::system::error_code err;
  json::value val = json::parse(body, err);
  if ( err ) {
    throw std::runtime_error("JSON parse error: " + err.message());
  }
  return val;
}

inline const json::object&
as_obj(const json::value& v)
{
  if ( !v.is_object() ) {
    throw std::runtime_error("expected object");
  } else {
    return v.as_object();
  }
}

inline const json::array&
as_arr(const json::value& v)
{
  if ( !v.is_array() ) {
    throw std::runtime_error("expected array");
  } else {
    return v.as_array();
  }
}

/************ string_list() *******************************/
/* Reads an array of strings under key. Missing key yields an empty
 * vector, a non-string element is an error
 */
inline std::vector<std::string>
string_list(const json::object& obj, std::string_view key)
{
  std::vector<std::string> out;
  const auto* p = obj.if_contains(key);
  if ( !p || p->is_null() ) {
    return out;
  }

  for (const auto& item : as_arr(*p)) {
    if ( !item.is_string() ) {
      throw std::runtime_error("expected string element under " + std::string(key));
    }
    out.emplace_back(item.as_string().c_str());
  }
  return out;
}

inline json::array
to_array(const std::vector<std::string>& items)
{
  json::array arr;
  arr.reserve(items.size());
  for (const auto& s : items) {
    arr.emplace_back(s);
  }
  return arr;
}

/************ decode_strings() ****************************/
/* Inverse of serialize(to_array(items)), used for list columns in sqlite.
 * Empty text is treated as an empty list
 */
inline std::vector<std::string>
decode_strings(std::string_view text)
{
  std::vector<std::string> out;
  if ( text.empty() ) {
    return out;
  }

  for (const auto& item : as_arr(parse(text))) {
    if ( item.is_string() ) {
      out.emplace_back(item.as_string().c_str());
    }
  }
  return out;
}

}
