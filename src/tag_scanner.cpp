#include "qsoflux/tag_scanner.hpp"

#include <cctype>
#include <charconv>
#include <utility>

namespace qsoflux {

namespace {

std::string_view TrimAscii(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

std::optional<std::size_t> ParseLength(std::string_view text) {
  text = TrimAscii(text);
  if (text.empty()) {
    return std::nullopt;
  }
  std::size_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// Walks the span tag by tag; fn receives each Tag as it is decoded.
template <typename Fn>
void ForEachTag(std::string_view span, Fn&& fn) {
  std::size_t i = 0;
  const std::size_t n = span.size();
  while (i < n) {
    const std::size_t open = span.find('<', i);
    if (open == std::string_view::npos) {
      return;
    }
    const std::size_t close = span.find('>', open + 1);
    if (close == std::string_view::npos) {
      return;
    }

    auto header = ParseTagHeader(span.substr(open + 1, close - open - 1));
    i = close + 1;

    Tag tag;
    tag.name = std::move(header.name);
    tag.declared_length = header.length;
    if (header.length && *header.length <= n - i) {
      tag.value.assign(span.substr(i, *header.length));
      tag.accepted = true;
      i += *header.length;
    }
    fn(std::move(tag));
  }
}

}  // namespace

TagHeader ParseTagHeader(std::string_view interior) {
  TagHeader header;
  const std::size_t colon = interior.find(':');
  const std::string_view name = TrimAscii(interior.substr(0, colon));

  header.name.reserve(name.size());
  for (unsigned char c : name) {
    header.name.push_back(static_cast<char>(std::toupper(c)));
  }

  if (colon != std::string_view::npos) {
    std::string_view rest = interior.substr(colon + 1);
    const std::size_t type_colon = rest.find(':');
    header.length = ParseLength(rest.substr(0, type_colon));
  }
  return header;
}

std::vector<Tag> ScanTags(std::string_view span) {
  std::vector<Tag> tags;
  ForEachTag(span, [&](Tag tag) { tags.push_back(std::move(tag)); });
  return tags;
}

RawFieldMap ScanRecord(std::string_view span) {
  RawFieldMap fields;
  ForEachTag(span, [&](Tag tag) {
    if (!tag.accepted || tag.name.empty()) {
      return;
    }
    fields.insert_or_assign(std::move(tag.name), std::move(tag.value));
  });
  return fields;
}

}  // namespace qsoflux
