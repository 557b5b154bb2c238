#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "memory_handle.hpp"
#include "stepfrag/converter.hpp"
#include "stepfrag/file_profiler.hpp"
#include "stepfrag/fragment_packer.hpp"

int main() {
  using namespace stepfrag;

  auto dir = std::filesystem::temp_directory_path() / "stepfrag_smoke";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  auto input = dir / "tower.ifc";
  {
    std::ofstream out(input, std::ios::binary);
    out << stepfrag::testing::SampleStepFile(5000);
  }

  auto profile = Profile(input);
  assert(profile.header_valid);
  assert(profile.schema_id == std::string("IFC4"));

  for (Codec codec : {Codec::kDeflate, Codec::kXz}) {
    Config cfg;
    cfg.codec = codec;
    cfg.chunk_bytes = 8192;
    std::ostringstream log;
    std::ostringstream err;
    Converter converter(cfg, {}, {}, log, err);
    auto output = DeriveOutputPath(input, cfg.output_extension);
    auto result = converter.Convert(input, output);
    assert(result.success);

    std::ifstream in(output, std::ios::binary);
    Bytes artifact((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto header = ReadArtifactHeader(artifact);
    assert(header.codec == codec);
    assert(header.entity_count == 5000);
    assert(header.source_bytes == profile.size_bytes);
    assert(result.stats->output_bytes == artifact.size());

    const auto text = log.str();
    const std::string done = "File reading completed";
    auto first = text.find(done);
    assert(first != std::string::npos);
    assert(text.find(done, first + 1) == std::string::npos);

    auto parsed = ParseResultLine(FormatResultLine(result));
    assert(parsed.has_value());
    assert((*parsed)["success"] == true);
    std::filesystem::remove(output);
  }

  std::filesystem::remove_all(dir);
  return 0;
}
