#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "qsoflux/awards.hpp"
#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/stream.hpp"

namespace qsoflux {

inline constexpr const char* kEnvPrefix = "QSOFLUX_";

struct Config {
  std::string env_path = ".env";

  std::size_t threads = 0;  // 0 -> auto
  std::size_t serial_threshold = 100;
  std::size_t batch_records = 256;
  std::size_t queue_capacity = 0;  // 0 -> derived from threads
  ImportBackendKind backend = ImportBackendKind::worker_pool;

  std::size_t summary_chunk_size = 5000;

  std::string program_id = std::string(kDefaultProgramId);
  std::string awards_config;  // JSON thresholds file; empty -> defaults
  std::uint64_t progress_interval_ms = 0;

  [[nodiscard]] PipelineConfig Pipeline() const;
  [[nodiscard]] SummaryOptions Summary() const;
  [[nodiscard]] EncoderOptions Encoder() const;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// KEY=VALUE lines; '#' comments, surrounding quotes and a UTF-8 BOM are
// tolerated. A missing file yields an empty map.
[[nodiscard]] EnvMap ReadEnvFile(const std::string& path);

// Applies recognised keys (with or without the QSOFLUX_ prefix). Values that
// fail to parse leave the field unchanged.
void ApplyEnvOverrides(Config& cfg, const EnvMap& env);

// QSOFLUX_* variables of the running process.
[[nodiscard]] EnvMap ProcessEnvironment();

// Defaults, then cfg.env_path, then the process environment.
[[nodiscard]] Config LoadConfig(const std::string& env_path = ".env");

[[nodiscard]] bool ParseBackendKind(const std::string& text, ImportBackendKind& kind);
[[nodiscard]] const char* BackendKindName(ImportBackendKind kind);

// Reads {"DXCC": 125, "VUCC": 75, "WAS": 50} on top of the defaults. Keys are
// uppercased; non-positive or non-integer values are ignored. A missing or
// malformed file yields the defaults.
[[nodiscard]] AwardThresholds LoadAwardThresholds(const std::string& path);

}  // namespace qsoflux
