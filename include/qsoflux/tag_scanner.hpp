#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qsoflux {

// Tag name (uppercased) -> last value seen within one record.
using RawFieldMap = std::unordered_map<std::string, std::string>;

// One decoded <NAME:LENGTH[:TYPE]>value unit. value is empty and accepted is
// false when the length was missing, unparsable or ran past the span.
struct Tag {
  std::string name;
  std::optional<std::size_t> declared_length;
  std::string value;
  bool accepted = false;
};

struct TagHeader {
  std::string name;
  std::optional<std::size_t> length;
};

// Splits the interior of <...> into the uppercased name and the first
// colon-delimited length. A trailing TYPE segment is ignored.
[[nodiscard]] TagHeader ParseTagHeader(std::string_view interior);

// Lexes every tag in one record span, skipped ones included.
[[nodiscard]] std::vector<Tag> ScanTags(std::string_view span);

// Lexes one record span straight into a field map (last write wins).
[[nodiscard]] RawFieldMap ScanRecord(std::string_view span);

}  // namespace qsoflux
