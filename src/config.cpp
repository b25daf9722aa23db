#include "qsoflux/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace qsoflux {

namespace {

constexpr const char* kKnownKeys[] = {
    "THREADS",    "SERIAL_THRESHOLD", "BATCH_RECORDS", "QUEUE_CAPACITY",       "BACKEND",
    "SUMMARY_CHUNK_SIZE", "PROGRAM_ID", "AWARDS_CONFIG", "PROGRESS_INTERVAL_MS",
};

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::size_t ParseSize(const std::string& s, std::size_t def_val) {
  const std::string v = Trim(s);
  if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return def_val;
  }
  try {
    return static_cast<std::size_t>(std::stoull(v));
  } catch (const std::out_of_range&) {
    return def_val;
  }
}

}  // namespace

PipelineConfig Config::Pipeline() const {
  PipelineConfig p;
  p.backend = backend;
  p.num_threads = threads;
  p.serial_threshold = serial_threshold;
  p.batch_records = batch_records;
  p.queue_capacity = queue_capacity;
  p.progress_interval_ms = progress_interval_ms;
  return p;
}

SummaryOptions Config::Summary() const {
  SummaryOptions s;
  s.chunk_size = summary_chunk_size;
  s.num_threads = threads;
  return s;
}

EncoderOptions Config::Encoder() const {
  EncoderOptions e;
  e.program_id = program_id;
  return e;
}

bool ParseBackendKind(const std::string& text, ImportBackendKind& kind) {
  const std::string v = ToLower(Trim(text));
  if (v == "async" || v == "future" || v == "futures") {
    kind = ImportBackendKind::async;
    return true;
  }
  if (v == "worker_pool" || v == "worker-pool" || v == "pool" || v == "threads") {
    kind = ImportBackendKind::worker_pool;
    return true;
  }
  return false;
}

const char* BackendKindName(ImportBackendKind kind) {
  switch (kind) {
    case ImportBackendKind::async:
      return "async";
    case ImportBackendKind::worker_pool:
      return "worker_pool";
  }
  return "unknown";
}

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const EnvMap& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(kEnvPrefix + key);
    if (it == env.end()) {
      it = env.find(key);
    }
    return it == env.end() ? nullptr : &it->second;
  };
  if (auto v = get("THREADS"))
    cfg.threads = ParseSize(*v, cfg.threads);
  if (auto v = get("SERIAL_THRESHOLD"))
    cfg.serial_threshold = ParseSize(*v, cfg.serial_threshold);
  if (auto v = get("BATCH_RECORDS")) {
    const std::size_t n = ParseSize(*v, cfg.batch_records);
    if (n > 0)
      cfg.batch_records = n;
  }
  if (auto v = get("QUEUE_CAPACITY"))
    cfg.queue_capacity = ParseSize(*v, cfg.queue_capacity);
  if (auto v = get("BACKEND")) {
    ImportBackendKind kind = cfg.backend;
    if (ParseBackendKind(*v, kind))
      cfg.backend = kind;
  }
  if (auto v = get("SUMMARY_CHUNK_SIZE")) {
    const std::size_t n = ParseSize(*v, cfg.summary_chunk_size);
    if (n > 0)
      cfg.summary_chunk_size = n;
  }
  if (auto v = get("PROGRAM_ID")) {
    if (!v->empty())
      cfg.program_id = *v;
  }
  if (auto v = get("AWARDS_CONFIG"))
    cfg.awards_config = *v;
  if (auto v = get("PROGRESS_INTERVAL_MS"))
    cfg.progress_interval_ms = ParseSize(*v, cfg.progress_interval_ms);
}

EnvMap ProcessEnvironment() {
  EnvMap env;
  for (const char* key : kKnownKeys) {
    const std::string name = std::string(kEnvPrefix) + key;
    if (const char* value = std::getenv(name.c_str())) {
      env[name] = value;
    }
  }
  return env;
}

Config LoadConfig(const std::string& env_path) {
  Config cfg;
  cfg.env_path = env_path;
  ApplyEnvOverrides(cfg, ReadEnvFile(cfg.env_path));
  ApplyEnvOverrides(cfg, ProcessEnvironment());
  return cfg;
}

AwardThresholds LoadAwardThresholds(const std::string& path) {
  AwardThresholds thresholds = DefaultAwardThresholds();
  if (path.empty()) {
    return thresholds;
  }
  std::ifstream in(path);
  if (!in) {
    return thresholds;
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return thresholds;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_number_integer()) {
      continue;
    }
    const auto value = it.value().get<std::int64_t>();
    if (value > 0) {
      thresholds[ToUpper(it.key())] = value;
    }
  }
  return thresholds;
}

}  // namespace qsoflux
