#include "ephem_core/types.hpp"

#include "ephem_core/errors.hpp"

namespace ephem_core {

std::string to_string(ContentKind kind) {
  switch (kind) {
    case ContentKind::Text:
      return "text";
    case ContentKind::Table:
      return "table";
    case ContentKind::Figure:
      return "figure";
    default:
      return "unknown";
  }
}

ContentKind content_kind_from_string(const std::string& str) {
  if (str == "text")
    return ContentKind::Text;
  if (str == "table")
    return ContentKind::Table;
  if (str == "figure")
    return ContentKind::Figure;
  throw InvalidArgumentError("Unknown content kind: " + str);
}

}  // namespace ephem_core
