#include "message_types.hpp"

#include <array>

namespace p3::store {

namespace {

struct keyword_entry {
  pop3_keyword keyword;
  std::string_view name;
};

constexpr std::array<keyword_entry, 16> k_pop3_keywords = {{
    {pop3_keyword::quit, "QUIT"},
    {pop3_keyword::stat, "STAT"},
    {pop3_keyword::list, "LIST"},
    {pop3_keyword::retr, "RETR"},
    {pop3_keyword::dele, "DELE"},
    {pop3_keyword::noop, "NOOP"},
    {pop3_keyword::rset, "RSET"},
    {pop3_keyword::top, "TOP"},
    {pop3_keyword::uidl, "UIDL"},
    {pop3_keyword::user, "USER"},
    {pop3_keyword::pass, "PASS"},
    {pop3_keyword::apop, "APOP"},
    {pop3_keyword::capa, "CAPA"},
    {pop3_keyword::stls, "STLS"},
    {pop3_keyword::auth, "AUTH"},
    {pop3_keyword::sasl, "SASL"},
}};

} // namespace

std::string_view message_kind_name(message_kind kind) {
  switch (kind) {
  case message_kind::opaque:
    return "opaque";
  case message_kind::segment:
    return "segment";
  case message_kind::pop3_command:
    return "pop3_command";
  case message_kind::pop3_response:
    return "pop3_response";
  case message_kind::pop3_transaction:
    return "pop3_transaction";
  case message_kind::gap:
    return "gap";
  case message_kind::capture_info:
    return "capture_info";
  }
  return "unknown";
}

std::string_view pop3_keyword_name(pop3_keyword keyword) {
  for (const auto& entry : k_pop3_keywords) {
    if (entry.keyword == keyword) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

std::optional<pop3_keyword> parse_pop3_keyword(std::string_view text) {
  for (const auto& entry : k_pop3_keywords) {
    if (entry.name == text) {
      return entry.keyword;
    }
  }
  return std::nullopt;
}

std::string_view pop3_status_name(pop3_status status) {
  switch (status) {
  case pop3_status::ok:
    return "OK";
  case pop3_status::err:
    return "ERR";
  }
  return "?";
}

std::string_view stream_direction_name(stream_direction direction) {
  switch (direction) {
  case stream_direction::unknown:
    return "unknown";
  case stream_direction::to_server:
    return "to_server";
  case stream_direction::to_client:
    return "to_client";
  }
  return "invalid";
}

} // namespace p3::store
