#pragma once

#include <cstdint>
#include <string>

#include "qsoflux/cursor.hpp"
#include "qsoflux/stream.hpp"

namespace qsoflux {

enum class LogCompression {
  none = 0,
  gzip,
  xz
};

// By extension: .gz -> gzip, .xz -> xz, anything else -> none.
[[nodiscard]] LogCompression DetectCompression(const std::string& path);

// Whole document as bytes, decompressed when needed. Throws
// std::runtime_error when the file cannot be opened or decoded.
[[nodiscard]] std::string ReadLogFile(const std::string& path);

// Streams the encoder output into path (gzip when it ends in .gz) and
// returns the number of records written. Throws std::runtime_error on I/O
// failure or for .xz targets.
std::uint64_t WriteLogFile(const std::string& path, QsoCursor& source, const EncoderOptions& options = {});

}  // namespace qsoflux
