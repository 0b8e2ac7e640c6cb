#include "schema_registry.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "message_codec.hpp"

namespace p3::store {

namespace {

template <typename T, bool (*Encode)(const T&, store_buffer_writer&, redlog::logger&)>
bool encode_as(const message_value& value, store_buffer_writer& writer, redlog::logger& log) {
  const T* typed = std::get_if<T>(&value);
  if (!typed) {
    log.err("message kind does not match schema");
    return false;
  }
  return Encode(*typed, writer, log);
}

template <typename T, bool (*Decode)(store_buffer_reader&, T&)>
bool decode_as(store_buffer_reader& reader, message_value& out) {
  T typed{};
  if (!Decode(reader, typed)) {
    return false;
  }
  out = std::move(typed);
  return true;
}

schema_descriptor make_descriptor(
    schema_tag tag, std::string name, uint16_t version, message_kind kind, encode_fn encode, decode_fn decode,
    uint32_t min_payload
) {
  schema_descriptor descriptor{};
  descriptor.tag = tag;
  descriptor.name = std::move(name);
  descriptor.version = version;
  descriptor.kind = kind;
  descriptor.encode = encode;
  descriptor.decode = decode;
  descriptor.min_payload = min_payload;
  return descriptor;
}

} // namespace

schema_registry::schema_registry(redlog::logger log) : log_(std::move(log)) {}

bool schema_registry::add(schema_descriptor descriptor) {
  if (descriptor.tag == k_invalid_schema_tag) {
    log_.err("schema tag 0 is reserved", redlog::field("name", descriptor.name));
    return false;
  }
  if (!descriptor.decode) {
    log_.err("schema missing decoder", redlog::field("tag", descriptor.tag), redlog::field("name", descriptor.name));
    return false;
  }
  auto kind_index = static_cast<size_t>(descriptor.kind);
  if (kind_index >= encoders_.size()) {
    log_.err("schema kind out of range", redlog::field("tag", descriptor.tag));
    return false;
  }

  auto it = std::lower_bound(
      descriptors_.begin(), descriptors_.end(), descriptor.tag,
      [](const schema_descriptor& entry, schema_tag value) { return entry.tag < value; }
  );
  if (it != descriptors_.end() && it->tag == descriptor.tag) {
    log_.err(
        "schema tag already registered", redlog::field("tag", descriptor.tag), redlog::field("existing", it->name),
        redlog::field("name", descriptor.name)
    );
    return false;
  }
  if (descriptor.encode && encoders_[kind_index] != k_invalid_schema_tag) {
    log_.err(
        "message kind already has an encoder", redlog::field("kind", message_kind_name(descriptor.kind)),
        redlog::field("tag", descriptor.tag), redlog::field("encoder_tag", encoders_[kind_index])
    );
    return false;
  }

  if (descriptor.encode) {
    encoders_[kind_index] = descriptor.tag;
  }
  log_.dbg(
      "schema registered", redlog::field("tag", descriptor.tag), redlog::field("name", descriptor.name),
      redlog::field("version", descriptor.version)
  );
  descriptors_.insert(it, std::move(descriptor));
  return true;
}

const schema_descriptor* schema_registry::find(schema_tag tag) const {
  auto it = std::lower_bound(
      descriptors_.begin(), descriptors_.end(), tag,
      [](const schema_descriptor& entry, schema_tag value) { return entry.tag < value; }
  );
  if (it == descriptors_.end() || it->tag != tag) {
    return nullptr;
  }
  return &(*it);
}

const schema_descriptor* schema_registry::encoder_for(message_kind kind) const {
  auto kind_index = static_cast<size_t>(kind);
  if (kind_index >= encoders_.size() || encoders_[kind_index] == k_invalid_schema_tag) {
    return nullptr;
  }
  return find(encoders_[kind_index]);
}

bool register_builtin_schemas(schema_registry& registry) {
  const schema_descriptor builtin[] = {
      make_descriptor(
          tags::opaque, "opaque", 1, message_kind::opaque, encode_as<opaque_message, encode_opaque>,
          decode_as<opaque_message, decode_opaque>, 0
      ),
      make_descriptor(
          tags::segment_v1, "segment", 1, message_kind::segment, nullptr,
          decode_as<stream_segment, decode_segment_v1>, 1 + 4
      ),
      make_descriptor(
          tags::pop3_command, "pop3.command", 1, message_kind::pop3_command,
          encode_as<pop3_command, encode_pop3_command>, decode_as<pop3_command, decode_pop3_command>, 1 + 1 + 4
      ),
      make_descriptor(
          tags::pop3_response, "pop3.response", 1, message_kind::pop3_response,
          encode_as<pop3_response, encode_pop3_response>, decode_as<pop3_response, decode_pop3_response>,
          1 + 1 + 4 + 4
      ),
      make_descriptor(
          tags::segment_v2, "segment", 2, message_kind::segment, encode_as<stream_segment, encode_segment_v2>,
          decode_as<stream_segment, decode_segment_v2>, 1 + 8 + 8 + 4
      ),
      make_descriptor(
          tags::pop3_transaction, "pop3.transaction", 1, message_kind::pop3_transaction,
          encode_as<pop3_transaction, encode_pop3_transaction>,
          decode_as<pop3_transaction, decode_pop3_transaction>, 1
      ),
      make_descriptor(
          tags::gap, "gap", 1, message_kind::gap, encode_as<stream_gap, encode_gap>,
          decode_as<stream_gap, decode_gap>, 0
      ),
      make_descriptor(
          tags::capture_info, "capture.info", 1, message_kind::capture_info,
          encode_as<capture_info, encode_capture_info>, decode_as<capture_info, decode_capture_info>, 4 + 4 + 4
      ),
  };

  for (const auto& descriptor : builtin) {
    if (!registry.add(descriptor)) {
      return false;
    }
  }
  return true;
}

const schema_registry& default_schema_registry() {
  static const schema_registry registry = [] {
    schema_registry built;
    if (!register_builtin_schemas(built)) {
      redlog::get_logger("p3store.registry").err("builtin schema table is inconsistent");
    }
    return built;
  }();
  return registry;
}

bool encode_message(
    const message_value& value, const schema_registry& registry, encoded_message& out, store_error& error,
    redlog::logger log
) {
  message_kind kind = kind_of(value);
  const schema_descriptor* descriptor = registry.encoder_for(kind);
  if (!descriptor) {
    error = make_store_error(error_kind::unknown_schema, "no schema registered for message kind");
    log.err("no schema registered for message kind", redlog::field("kind", message_kind_name(kind)));
    return false;
  }

  out.tag = descriptor->tag;
  out.payload.clear();
  store_buffer_writer writer(out.payload);
  if (!descriptor->encode(value, writer, log)) {
    error = make_store_error(error_kind::schema_mismatch, "message does not fit its schema");
    log.err("failed to encode message", redlog::field("tag", descriptor->tag), redlog::field("name", descriptor->name));
    out.payload.clear();
    return false;
  }
  return true;
}

bool decode_message(
    schema_tag tag, std::span<const uint8_t> payload, const schema_registry& registry, message_value& out,
    store_error& error
) {
  const schema_descriptor* descriptor = registry.find(tag);
  if (!descriptor) {
    error = make_store_error(error_kind::unknown_schema, "schema tag not registered: " + std::to_string(tag));
    return false;
  }
  if (payload.size() < descriptor->min_payload) {
    error = make_store_error(error_kind::schema_mismatch, "payload shorter than " + descriptor->name + " layout");
    return false;
  }

  // out is only replaced by a payload that decodes completely
  store_buffer_reader reader(payload);
  message_value decoded;
  if (!descriptor->decode(reader, decoded)) {
    error = make_store_error(error_kind::schema_mismatch, "payload does not match " + descriptor->name + " layout");
    return false;
  }
  if (!reader.at_end()) {
    error = make_store_error(
        error_kind::schema_mismatch,
        "trailing bytes after " + descriptor->name + " payload: " + std::to_string(reader.remaining())
    );
    return false;
  }
  out = std::move(decoded);
  return true;
}

} // namespace p3::store
