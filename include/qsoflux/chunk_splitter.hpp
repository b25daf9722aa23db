#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>
#include <vector>

namespace qsoflux {

inline constexpr std::string_view kEndOfHeader = "<EOH>";
inline constexpr std::string_view kEndOfRecord = "<EOR>";

// Lazy view over the record spans of an ADIF document. The document must
// outlive the splitter and every span it yields. Iteration can be restarted
// by calling begin() again.
class ChunkSplitter {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::string_view;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string_view*;
    using reference = const std::string_view&;

    Iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    Iterator& operator++();
    Iterator operator++(int);

    bool operator==(const Iterator& other) const {
      return done_ == other.done_ && (done_ || pos_ == other.pos_);
    }

   private:
    friend class ChunkSplitter;
    Iterator(std::string_view body, std::size_t pos);

    void Advance();

    std::string_view body_;
    std::size_t pos_ = 0;
    std::string_view current_;
    bool done_ = true;
  };

  explicit ChunkSplitter(std::string_view document);

  [[nodiscard]] Iterator begin() const { return Iterator(body_, 0); }
  [[nodiscard]] Iterator end() const { return Iterator(); }

  // Text before the first <EOH>, empty when the document has no header.
  [[nodiscard]] std::string_view Header() const { return header_; }
  [[nodiscard]] std::string_view Body() const { return body_; }

  // Materializes the spans (views into the document) in document order.
  [[nodiscard]] std::vector<std::string_view> Collect() const;

 private:
  std::string_view header_;
  std::string_view body_;
};

[[nodiscard]] bool IsBlank(std::string_view s);

}  // namespace qsoflux
