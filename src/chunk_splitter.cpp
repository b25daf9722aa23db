#include "qsoflux/chunk_splitter.hpp"

#include <cctype>

namespace qsoflux {

bool IsBlank(std::string_view s) {
  for (unsigned char c : s) {
    if (!std::isspace(c)) {
      return false;
    }
  }
  return true;
}

ChunkSplitter::ChunkSplitter(std::string_view document) {
  const std::size_t eoh = document.find(kEndOfHeader);
  if (eoh == std::string_view::npos) {
    body_ = document;
    return;
  }
  header_ = document.substr(0, eoh);
  body_ = document.substr(eoh + kEndOfHeader.size());
}

std::vector<std::string_view> ChunkSplitter::Collect() const {
  std::vector<std::string_view> spans;
  for (auto span : *this) {
    spans.push_back(span);
  }
  return spans;
}

ChunkSplitter::Iterator::Iterator(std::string_view body, std::size_t pos)
    : body_(body), pos_(pos), done_(false) {
  Advance();
}

ChunkSplitter::Iterator& ChunkSplitter::Iterator::operator++() {
  Advance();
  return *this;
}

ChunkSplitter::Iterator ChunkSplitter::Iterator::operator++(int) {
  Iterator prev = *this;
  Advance();
  return prev;
}

// Moves to the next non-blank span; text after the last <EOR> counts as a
// span of its own.
void ChunkSplitter::Iterator::Advance() {
  while (pos_ < body_.size()) {
    const std::size_t marker = body_.find(kEndOfRecord, pos_);
    const std::size_t stop = marker == std::string_view::npos ? body_.size() : marker;
    std::string_view span = body_.substr(pos_, stop - pos_);
    pos_ = marker == std::string_view::npos ? body_.size() : marker + kEndOfRecord.size();
    if (!IsBlank(span)) {
      current_ = span;
      return;
    }
  }
  current_ = {};
  done_ = true;
}

}  // namespace qsoflux
