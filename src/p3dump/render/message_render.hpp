#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "p3store/io/store_reader.hpp"
#include "p3store/schema/message_types.hpp"
#include "p3store/schema/schema_registry.hpp"

namespace p3dump::render {

struct render_options {
  // bytes shown per payload field; 0 shows everything
  size_t max_bytes = 64;
};

std::string schema_label(const p3::store::schema_registry& registry, p3::store::schema_tag tag);

// single line, no trailing newline
std::string render_message_text(const p3::store::message_value& value, const render_options& options);

void write_entry_text(
    std::ostream& out, const p3::store::store_entry& entry, const p3::store::schema_registry& registry,
    const render_options& options
);
void write_entry_json(
    std::ostream& out, const p3::store::store_entry& entry, const p3::store::schema_registry& registry
);

} // namespace p3dump::render
