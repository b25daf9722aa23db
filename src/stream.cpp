#include "qsoflux/stream.hpp"

#include <cstddef>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace qsoflux {

namespace {
void AppendField(std::string& out, std::string_view tag, const std::optional<std::string>& value) {
  if (value && !value->empty()) {
    out += EncodeField(tag, *value);
  }
}
}  // namespace

std::string EncodeField(std::string_view tag, std::string_view value) {
  std::string out;
  out.reserve(tag.size() + value.size() + 8);
  out.push_back('<');
  out.append(tag);
  out.push_back(':');
  out.append(std::to_string(value.size()));
  out.push_back('>');
  out.append(value);
  return out;
}

std::string FormatFrequency(double mhz) {
  const int len = std::snprintf(nullptr, 0, "%.6f", mhz);
  if (len <= 0) {
    throw std::runtime_error("failed to format frequency");
  }
  std::string text(static_cast<std::size_t>(len) + 1, '\0');
  std::snprintf(text.data(), text.size(), "%.6f", mhz);
  text.resize(static_cast<std::size_t>(len));
  if (text.find('.') != std::string::npos) {
    while (!text.empty() && text.back() == '0') {
      text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
  }
  return text;
}

std::string EncodeHeader(const EncoderOptions& options) {
  std::string out;
  out += EncodeField("ADIF_VER", kAdifVersion);
  out += "\n";
  out += EncodeField("PROGRAMID", options.program_id);
  out += "\n<EOH>\n";
  return out;
}

std::string EncodeRecord(const Qso& qso) {
  std::string out;
  out += EncodeField("QSO_DATE", FormatQsoDate(qso.start_at));
  out += EncodeField("TIME_ON", FormatTimeOn(qso.start_at));
  out += EncodeField("CALL", qso.call);
  AppendField(out, "BAND", qso.band);
  AppendField(out, "MODE", qso.mode);
  if (qso.freq_mhz) {
    out += EncodeField("FREQ", FormatFrequency(*qso.freq_mhz));
  }
  AppendField(out, "RST_SENT", qso.rst_sent);
  AppendField(out, "RST_RCVD", qso.rst_rcvd);
  AppendField(out, "NAME", qso.name);
  AppendField(out, "QTH", qso.qth);
  AppendField(out, "GRIDSQUARE", qso.grid);
  AppendField(out, "COUNTRY", qso.country);
  AppendField(out, "COMMENT", qso.comment);
  out += "<EOR>\n";
  return out;
}

std::optional<std::string> StreamingEncoder::Next() {
  if (!header_done_) {
    header_done_ = true;
    return EncodeHeader(options_);
  }
  if (exhausted_) {
    return std::nullopt;
  }
  auto qso = source_.Next();
  if (!qso) {
    exhausted_ = true;
    return std::nullopt;
  }
  ++records_;
  return EncodeRecord(*qso);
}

std::uint64_t EncodeToStream(QsoCursor& source, std::ostream& out, const EncoderOptions& options) {
  StreamingEncoder encoder(source, options);
  while (auto fragment = encoder.Next()) {
    out.write(fragment->data(), static_cast<std::streamsize>(fragment->size()));
    if (!out) {
      throw std::runtime_error("failed to write ADIF output");
    }
  }
  return encoder.RecordsEmitted();
}

std::string EncodeDocument(const QsoList& records, const EncoderOptions& options) {
  VectorCursor cursor(records);
  std::ostringstream oss;
  EncodeToStream(cursor, oss, options);
  return oss.str();
}

}  // namespace qsoflux
