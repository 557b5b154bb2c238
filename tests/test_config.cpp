#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "stepfrag/config.hpp"

int main() {
  using namespace stepfrag;

  auto path = std::filesystem::temp_directory_path() / "stepfrag_test.env";
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "\xEF\xBB\xBF"
        << "STEPFRAG_CODEC=xz\r\n"
        << "# comment line\n"
        << "\n"
        << "STEPFRAG_LEVEL = 3\n"
        << "STEPFRAG_OUTPUT_EXT=\"fragments\"\n"
        << "STEPFRAG_CHUNK_BYTES='65536'\n"
        << "STEPFRAG_INFER_COMPLETION=off\n"
        << "not a pair\n";
  }

  auto env = ReadEnvFile(path.string());
  assert(env.size() == 5);
  assert(env["STEPFRAG_CODEC"] == "xz");
  assert(env["STEPFRAG_LEVEL"] == "3");
  assert(env["STEPFRAG_OUTPUT_EXT"] == "fragments");
  assert(env["STEPFRAG_CHUNK_BYTES"] == "65536");

  Config cfg;
  assert(cfg.codec == Codec::kDeflate);
  assert(cfg.output_extension == ".frag");
  ApplyEnvOverrides(cfg, env);
  assert(cfg.codec == Codec::kXz);
  assert(cfg.level == 3);
  assert(cfg.output_extension == ".fragments");
  assert(cfg.chunk_bytes == 65536);
  assert(!cfg.infer_completion);

  // malformed values keep what was there
  Config kept = cfg;
  ApplyEnvOverrides(kept, {{"STEPFRAG_LEVEL", "11"},
                           {"STEPFRAG_CHUNK_BYTES", "12kb"},
                           {"STEPFRAG_CODEC", "brotli"},
                           {"STEPFRAG_PROGRESS_INTERVAL_MS", "-5"},
                           {"STEPFRAG_INFER_COMPLETION", "maybe"}});
  assert(kept.level == 3);
  assert(kept.chunk_bytes == 65536);
  assert(kept.codec == Codec::kXz);
  assert(kept.progress_interval_ms == cfg.progress_interval_ms);
  assert(!kept.infer_completion);

  Codec codec = Codec::kDeflate;
  assert(ParseCodec(" LZMA ", codec) && codec == Codec::kXz);
  assert(ParseCodec("zlib", codec) && codec == Codec::kDeflate);
  assert(std::string(CodecName(Codec::kXz)) == "xz");

  assert(ReadEnvFile((std::filesystem::temp_directory_path() / "stepfrag_no_such.env").string()).empty());

  auto loaded = LoadConfig(path.string());
  assert(loaded.env_path == path.string());
  std::filesystem::remove(path);

  std::cout << "config tests ok\n";
  return 0;
}
