#pragma once

#include <string>

namespace ephem_core {

// Closed set of content kinds an upstream parser can emit for a chunk
enum class ContentKind { Text, Table, Figure };

// Conversion utilities
std::string to_string(ContentKind kind);
ContentKind content_kind_from_string(const std::string& str);

}  // namespace ephem_core
