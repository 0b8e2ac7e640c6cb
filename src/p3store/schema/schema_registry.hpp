#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "p3store/format/store_format.hpp"
#include "p3store/format/store_io.hpp"
#include "message_types.hpp"

namespace p3::store {

using encode_fn = bool (*)(const message_value& value, store_buffer_writer& writer, redlog::logger& log);
using decode_fn = bool (*)(store_buffer_reader& reader, message_value& out);

namespace tags {
constexpr schema_tag opaque = 1;
constexpr schema_tag segment_v1 = 2;
constexpr schema_tag pop3_command = 3;
constexpr schema_tag pop3_response = 4;
constexpr schema_tag segment_v2 = 5;
constexpr schema_tag pop3_transaction = 6;
constexpr schema_tag gap = 7;
constexpr schema_tag capture_info = 8;
} // namespace tags

struct schema_descriptor {
  schema_tag tag = k_invalid_schema_tag;
  std::string name;
  uint16_t version = 0;
  message_kind kind = message_kind::opaque;
  // null for superseded layouts that are only read
  encode_fn encode = nullptr;
  decode_fn decode = nullptr;
  uint32_t min_payload = 0;
};

struct encoded_message {
  schema_tag tag = k_invalid_schema_tag;
  std::vector<uint8_t> payload;
};

class schema_registry {
public:
  explicit schema_registry(redlog::logger log = redlog::get_logger("p3store.registry"));

  // additive only: a tag that is already registered is never replaced
  bool add(schema_descriptor descriptor);

  const schema_descriptor* find(schema_tag tag) const;
  const schema_descriptor* encoder_for(message_kind kind) const;
  const std::vector<schema_descriptor>& descriptors() const { return descriptors_; }
  size_t size() const { return descriptors_.size(); }

private:
  redlog::logger log_;
  std::vector<schema_descriptor> descriptors_;
  std::array<schema_tag, k_message_kind_count> encoders_{};
};

// built-in table of released tags
const schema_registry& default_schema_registry();
bool register_builtin_schemas(schema_registry& registry);

bool encode_message(
    const message_value& value, const schema_registry& registry, encoded_message& out, store_error& error,
    redlog::logger log
);

bool decode_message(
    schema_tag tag, std::span<const uint8_t> payload, const schema_registry& registry, message_value& out,
    store_error& error
);

} // namespace p3::store
