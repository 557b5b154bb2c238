#include "stepfrag/config.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace stepfrag {

namespace {

constexpr std::array<const char*, 6> kEnvKeys = {
    "STEPFRAG_CODEC",
    "STEPFRAG_LEVEL",
    "STEPFRAG_CHUNK_BYTES",
    "STEPFRAG_OUTPUT_EXT",
    "STEPFRAG_PROGRESS_INTERVAL_MS",
    "STEPFRAG_INFER_COMPLETION",
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

std::string LowerAscii(std::string value) {
  for (char& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

std::size_t ParseSize(const std::string& s, std::size_t def_val) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
    return def_val;
  }
  try {
    std::size_t consumed = 0;
    auto v = std::stoull(s, &consumed);
    if (consumed != s.size()) {
      return def_val;
    }
    return static_cast<std::size_t>(v);
  } catch (const std::logic_error&) {
    return def_val;
  }
}

bool ParseBool(const std::string& s, bool def_val) {
  auto v = LowerAscii(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  return def_val;
}

}  // namespace

const char* CodecName(Codec codec) {
  switch (codec) {
    case Codec::kDeflate:
      return "deflate";
    case Codec::kXz:
      return "xz";
  }
  return "unknown";
}

bool ParseCodec(const std::string& value, Codec& out) {
  auto v = LowerAscii(Trim(value));
  if (v == "deflate" || v == "zlib" || v == "gzip") {
    out = Codec::kDeflate;
    return true;
  }
  if (v == "xz" || v == "lzma") {
    out = Codec::kXz;
    return true;
  }
  return false;
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

EnvMap ReadProcessEnv() {
  EnvMap env;
  for (const char* key : kEnvKeys) {
    if (const char* value = std::getenv(key)) {
      env[key] = value;
    }
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const EnvMap& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("STEPFRAG_CODEC")) {
    Codec codec = cfg.codec;
    if (ParseCodec(*v, codec)) {
      cfg.codec = codec;
    }
  }
  if (auto v = get("STEPFRAG_LEVEL")) {
    auto level = ParseSize(*v, static_cast<std::size_t>(cfg.level));
    if (level <= 9) {
      cfg.level = static_cast<int>(level);
    }
  }
  if (auto v = get("STEPFRAG_CHUNK_BYTES")) {
    auto chunk = ParseSize(*v, cfg.chunk_bytes);
    if (chunk > 0 && chunk <= 0xFFFFFFFFull) {
      cfg.chunk_bytes = chunk;
    }
  }
  if (auto v = get("STEPFRAG_OUTPUT_EXT")) {
    if (!v->empty()) {
      cfg.output_extension = (*v)[0] == '.' ? *v : "." + *v;
    }
  }
  if (auto v = get("STEPFRAG_PROGRESS_INTERVAL_MS")) {
    cfg.progress_interval_ms = ParseSize(*v, cfg.progress_interval_ms);
  }
  if (auto v = get("STEPFRAG_INFER_COMPLETION")) {
    cfg.infer_completion = ParseBool(*v, cfg.infer_completion);
  }
}

Config LoadConfig(const std::string& env_path) {
  Config cfg;
  cfg.env_path = env_path;
  ApplyEnvOverrides(cfg, ReadEnvFile(env_path));
  ApplyEnvOverrides(cfg, ReadProcessEnv());
  return cfg;
}

}  // namespace stepfrag
