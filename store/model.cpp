/*
 * model.cpp  Andrew Belles  Nov 20th, 2025
 *
 */

#include "ctxpipe/store/model.hpp"

#include <cctype>
#include <chrono>

namespace dat {

std::string_view
to_string(RecordKind kind) noexcept
{
  switch ( kind ) {
    case RecordKind::Entity:  return "entity";
    case RecordKind::General: return "general";
  }
  return "entity";
}

std::optional<RecordKind>
parse_kind(std::string_view name) noexcept
{
  if ( name == "entity" ) {
    return RecordKind::Entity;
  }
  if ( name == "general" ) {
    return RecordKind::General;
  }
  return std::nullopt;
}

std::string
normalize_name(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  bool pending_space = false;
  for (unsigned char c : name) {
    if ( std::isalnum(c) ) {
      if ( pending_space && !out.empty() ) {
        out.push_back(' ');
      }
      pending_space = false;
      out.push_back(static_cast<char>(std::tolower(c)));
    } else {
      pending_space = true;
    }
  }
  return out;
}

std::string
make_record_key(std::string_view name, std::string_view topic)
{
  return normalize_name(name) + "|" + normalize_name(topic);
}

int64_t
now_ms() noexcept
{
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}
