#pragma once

#include <istream>
#include <ostream>

#include "store_format.hpp"

namespace p3::store {

bool write_store_header(std::ostream& out, const store_header& header);

// validates magic, major version and header size, then leaves the stream at the first frame
bool read_store_header(std::istream& in, store_header& header, store_error& error);

} // namespace p3::store
