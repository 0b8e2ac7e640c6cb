#include "message_render.hpp"

#include <span>
#include <sstream>
#include <string_view>
#include <variant>
#include <vector>

#include "p3base/format_utils.hpp"
#include "p3base/json_utils.hpp"

namespace p3dump::render {

namespace {

using p3::util::format_hex_bytes;
using p3::util::format_printable;
using p3::util::quote_json_string;

std::string_view as_text(std::span<const uint8_t> bytes) {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string keyword_text(const p3::store::pop3_command& command) {
  if (command.keyword == p3::store::pop3_keyword::unknown && !command.unknown_keyword.empty()) {
    return command.unknown_keyword;
  }
  return std::string(p3::store::pop3_keyword_name(command.keyword));
}

class text_renderer {
public:
  text_renderer(std::ostream& out, const render_options& options) : out_(out), options_(options) {}

  void handle(const p3::store::opaque_message& message) {
    out_ << "opaque size=" << message.bytes.size() << " hex=" << format_hex_bytes(message.bytes, options_.max_bytes);
  }

  void handle(const p3::store::stream_segment& segment) {
    out_ << "segment dir=" << p3::store::stream_direction_name(segment.direction) << " stream=" << segment.stream_id
         << " at=" << segment.stream_offset << " size=" << segment.data.size()
         << " data=\"" << format_printable(segment.data, options_.max_bytes) << "\"";
  }

  void handle(const p3::store::pop3_command& command) {
    out_ << "pop3.command " << keyword_text(command);
    for (const auto& arg : command.args) {
      out_ << " \"" << format_printable(arg, options_.max_bytes) << "\"";
    }
    write_flags(command.error_flags);
  }

  void handle(const p3::store::pop3_response& response) {
    out_ << "pop3.response " << p3::store::pop3_status_name(response.status) << " \""
         << format_printable(response.header, options_.max_bytes) << "\" lines=" << response.data.size();
    write_flags(response.error_flags);
  }

  void handle(const p3::store::pop3_transaction& transaction) {
    out_ << "pop3.transaction";
    if (transaction.command) {
      out_ << " [";
      handle(*transaction.command);
      out_ << "]";
    }
    if (transaction.response) {
      out_ << " [";
      handle(*transaction.response);
      out_ << "]";
    }
  }

  void handle(const p3::store::stream_gap&) { out_ << "gap"; }

  void handle(const p3::store::capture_info& info) {
    out_ << "capture.info protocol=" << info.protocol << " parser=" << info.parser_version;
    for (const auto& [key, value] : info.attrs) {
      out_ << " " << key << "=" << value;
    }
  }

private:
  void write_flags(uint8_t flags) {
    if (flags != 0) {
      out_ << " flags=" << p3::util::format_hex(flags, 2);
    }
  }

  std::ostream& out_;
  const render_options& options_;
};

class json_renderer {
public:
  explicit json_renderer(std::ostream& out) : out_(out) {}

  void handle(const p3::store::opaque_message& message) {
    out_ << "{\"kind\":\"opaque\",\"hex\":" << quote_json_string(format_hex_bytes(message.bytes)) << "}";
  }

  void handle(const p3::store::stream_segment& segment) {
    out_ << "{\"kind\":\"segment\",\"direction\":"
         << quote_json_string(p3::store::stream_direction_name(segment.direction))
         << ",\"stream_id\":" << segment.stream_id << ",\"stream_offset\":" << segment.stream_offset
         << ",\"data\":" << quote_json_string(as_text(segment.data)) << "}";
  }

  void handle(const p3::store::pop3_command& command) {
    out_ << "{\"kind\":\"pop3.command\",\"keyword\":" << quote_json_string(keyword_text(command))
         << ",\"error_flags\":" << static_cast<int>(command.error_flags) << ",\"args\":";
    write_list(command.args);
    out_ << "}";
  }

  void handle(const p3::store::pop3_response& response) {
    out_ << "{\"kind\":\"pop3.response\",\"status\":"
         << quote_json_string(p3::store::pop3_status_name(response.status))
         << ",\"error_flags\":" << static_cast<int>(response.error_flags)
         << ",\"header\":" << quote_json_string(as_text(response.header)) << ",\"data\":";
    write_list(response.data);
    out_ << "}";
  }

  void handle(const p3::store::pop3_transaction& transaction) {
    out_ << "{\"kind\":\"pop3.transaction\",\"command\":";
    if (transaction.command) {
      handle(*transaction.command);
    } else {
      out_ << "null";
    }
    out_ << ",\"response\":";
    if (transaction.response) {
      handle(*transaction.response);
    } else {
      out_ << "null";
    }
    out_ << "}";
  }

  void handle(const p3::store::stream_gap&) { out_ << "{\"kind\":\"gap\"}"; }

  void handle(const p3::store::capture_info& info) {
    out_ << "{\"kind\":\"capture.info\",\"protocol\":" << quote_json_string(info.protocol)
         << ",\"parser_version\":" << quote_json_string(info.parser_version) << ",\"attrs\":{";
    for (size_t i = 0; i < info.attrs.size(); ++i) {
      if (i > 0) {
        out_ << ",";
      }
      out_ << quote_json_string(info.attrs[i].first) << ":" << quote_json_string(info.attrs[i].second);
    }
    out_ << "}}";
  }

private:
  void write_list(const std::vector<p3::store::byte_buffer>& items) {
    out_ << "[";
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) {
        out_ << ",";
      }
      out_ << quote_json_string(as_text(items[i]));
    }
    out_ << "]";
  }

  std::ostream& out_;
};

} // namespace

std::string schema_label(const p3::store::schema_registry& registry, p3::store::schema_tag tag) {
  if (const auto* descriptor = registry.find(tag)) {
    return descriptor->name + "/v" + std::to_string(descriptor->version);
  }
  return "tag" + std::to_string(tag);
}

std::string render_message_text(const p3::store::message_value& value, const render_options& options) {
  std::ostringstream out;
  text_renderer renderer(out, options);
  std::visit([&renderer](const auto& message) { renderer.handle(message); }, value);
  return out.str();
}

void write_entry_text(
    std::ostream& out, const p3::store::store_entry& entry, const p3::store::schema_registry& registry,
    const render_options& options
) {
  out << "#" << entry.index << " @" << p3::util::format_hex(entry.offset) << " " << schema_label(registry, entry.tag)
      << " size=" << entry.payload_size << " ";
  if (entry.value) {
    out << render_message_text(*entry.value, options);
  } else if (entry.error) {
    out << "error=" << p3::store::to_string(entry.error->kind) << " (" << entry.error->message << ")";
  }
}

void write_entry_json(
    std::ostream& out, const p3::store::store_entry& entry, const p3::store::schema_registry& registry
) {
  out << "{\"index\":" << entry.index << ",\"offset\":" << entry.offset << ",\"tag\":" << entry.tag
      << ",\"schema\":" << quote_json_string(schema_label(registry, entry.tag))
      << ",\"size\":" << entry.payload_size << ",";
  if (entry.value) {
    out << "\"message\":";
    json_renderer renderer(out);
    std::visit([&renderer](const auto& message) { renderer.handle(message); }, *entry.value);
  } else if (entry.error) {
    out << "\"error\":{\"kind\":" << quote_json_string(p3::store::to_string(entry.error->kind))
        << ",\"message\":" << quote_json_string(entry.error->message) << "}";
  } else {
    out << "\"message\":null";
  }
  out << "}";
}

} // namespace p3dump::render
