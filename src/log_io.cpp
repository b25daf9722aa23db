#include "qsoflux/log_io.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <lzma.h>
#include <zlib.h>

namespace qsoflux {

namespace {

std::string ReadPlain(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open log file: " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string ReadGzip(const std::string& path) {
  gzFile f = gzopen(path.c_str(), "rb");
  if (!f) {
    throw std::runtime_error("failed to open log file: " + path);
  }
  std::vector<char> buf(1 << 16);
  std::string out;
  while (true) {
    int got = gzread(f, buf.data(), static_cast<unsigned int>(buf.size()));
    if (got < 0) {
      gzclose(f);
      throw std::runtime_error("gzip decode failed: " + path);
    }
    if (got == 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(got));
  }
  gzclose(f);
  return out;
}

bool DecodeXzStream(std::istream& in, const std::function<void(const char*, std::size_t)>& on_chunk) {
  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  lzma_action action = LZMA_RUN;
  bool eof = false;
  bool ok = true;

  while (true) {
    if (strm.avail_in == 0 && !eof) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      const std::streamsize got = in.gcount();
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) {
        eof = true;
        action = LZMA_FINISH;
      }
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();

    const lzma_ret ret = lzma_code(&strm, action);
    const std::size_t produced = out_buf.size() - strm.avail_out;
    if (produced > 0) {
      on_chunk(reinterpret_cast<const char*>(out_buf.data()), produced);
    }

    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) {
      ok = false;
      break;
    }
    if (eof && strm.avail_in == 0 && produced == 0) {
      ok = false;
      break;
    }
  }

  lzma_end(&strm);
  return ok;
}

std::string ReadXz(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open log file: " + path);
  }
  std::string out;
  if (!DecodeXzStream(in, [&](const char* data, std::size_t n) { out.append(data, n); })) {
    throw std::runtime_error("xz decode failed: " + path);
  }
  return out;
}

}  // namespace

LogCompression DetectCompression(const std::string& path) {
  const auto ext = std::filesystem::path(path).extension().string();
  if (ext == ".gz") return LogCompression::gzip;
  if (ext == ".xz") return LogCompression::xz;
  return LogCompression::none;
}

std::string ReadLogFile(const std::string& path) {
  switch (DetectCompression(path)) {
    case LogCompression::gzip:
      return ReadGzip(path);
    case LogCompression::xz:
      return ReadXz(path);
    case LogCompression::none:
      break;
  }
  return ReadPlain(path);
}

std::uint64_t WriteLogFile(const std::string& path, QsoCursor& source, const EncoderOptions& options) {
  const auto compression = DetectCompression(path);
  if (compression == LogCompression::xz) {
    throw std::runtime_error("writing .xz logs is not supported: " + path);
  }

  if (compression == LogCompression::none) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to create log file: " + path);
    }
    const auto written = EncodeToStream(source, out, options);
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to flush log file: " + path);
    }
    return written;
  }

  gzFile f = gzopen(path.c_str(), "wb");
  if (!f) {
    throw std::runtime_error("failed to create log file: " + path);
  }
  StreamingEncoder encoder(source, options);
  while (auto fragment = encoder.Next()) {
    if (fragment->empty()) {
      continue;
    }
    const int wrote = gzwrite(f, fragment->data(), static_cast<unsigned int>(fragment->size()));
    if (wrote != static_cast<int>(fragment->size())) {
      gzclose(f);
      throw std::runtime_error("gzip write failed: " + path);
    }
  }
  if (gzclose(f) != Z_OK) {
    throw std::runtime_error("failed to close log file: " + path);
  }
  return encoder.RecordsEmitted();
}

}  // namespace qsoflux
