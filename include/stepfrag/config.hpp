#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace stepfrag {

enum class Codec : std::uint8_t {
  kDeflate = 1,
  kXz = 2,
};

struct Config {
  std::string env_path = ".env";
  Codec codec = Codec::kDeflate;
  int level = 6;                        // zlib level or xz preset, 0-9
  std::size_t chunk_bytes = 1 << 20;    // packer read size per request
  std::string output_extension = ".frag";
  std::size_t progress_interval_ms = 1000;
  bool infer_completion = true;         // offset wraparound marks the stream finished
};

using EnvMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] EnvMap ReadEnvFile(const std::string& path);
[[nodiscard]] EnvMap ReadProcessEnv();
void ApplyEnvOverrides(Config& cfg, const EnvMap& env);

// Defaults, then the .env file at cfg.env_path, then the process environment.
[[nodiscard]] Config LoadConfig(const std::string& env_path = ".env");

[[nodiscard]] const char* CodecName(Codec codec);
[[nodiscard]] bool ParseCodec(const std::string& value, Codec& out);

}  // namespace stepfrag
