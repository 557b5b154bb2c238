#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "memory_handle.hpp"
#include "stepfrag/file_profiler.hpp"

namespace {

std::filesystem::path WriteTemp(const std::string& name, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return path;
}

}  // namespace

int main() {
  using namespace stepfrag;

  // tier thresholds are exact and lower-inclusive
  assert(ClassifySizeTier(0) == SizeTier::kSmall);
  assert(ClassifySizeTier(100 * kMiB - 1) == SizeTier::kSmall);
  assert(ClassifySizeTier(100 * kMiB) == SizeTier::kWarning);
  assert(ClassifySizeTier(500 * kMiB - 1) == SizeTier::kWarning);
  assert(ClassifySizeTier(500 * kMiB) == SizeTier::kCritical);
  assert(std::string(SizeTierName(SizeTier::kCritical)) == "critical");

  // header check and single-byte mutations
  const std::string header = "ISO-10303-21;\nHEADER;\n";
  assert(HasValidHeader(header));
  assert(!HasValidHeader("ISO-10303-21"));
  assert(!HasValidHeader(""));
  for (std::size_t i = 0; i < kStepMagic.size(); ++i) {
    std::string mutated = header;
    mutated[i] = static_cast<char>(mutated[i] ^ 0x01);
    assert(!HasValidHeader(mutated));
  }

  // memory estimates
  assert(EstimateRamMb(0) == 0);
  assert(EstimateRamMb(10 * kMiB) == 30);
  assert(EstimateRamMb(1) == 1);
  assert(EstimateRamMb(kMiB / 2) == 2);
  assert(!RecommendedHeapMb(50 * kMiB).has_value());
  assert(RecommendedHeapMb(50 * kMiB + 1) == 4096u);
  assert(RecommendedHeapMb(200 * kMiB) == 4096u);
  assert(RecommendedHeapMb(200 * kMiB + 1) == 8192u);

  // schema extraction
  assert(ExtractSchemaId("FILE_SCHEMA(('IFC4'));") == std::string("IFC4"));
  assert(ExtractSchemaId("file_schema ( ('IFC2X3'));") == std::string("IFC2X3"));
  assert(!ExtractSchemaId("FILE_SCHEMA(('IFC2X3','X'));").has_value());
  assert(!ExtractSchemaId("FILE_SCHEMA(());").has_value());
  assert(!ExtractSchemaId("HEADER;").has_value());
  assert(ExtractSchemaId("FILE_SCHEMA(('A','B')); FILE_SCHEMA(('IFC4X3'));") == std::string("IFC4X3"));
  assert(ExtractSchemaId("FILE_SCHEMA(('FIRST')); FILE_SCHEMA(('SECOND'));") == std::string("FIRST"));

  // encoding anomalies
  assert(!HasEncodingAnomaly("ISO-10303-21;"));
  assert(HasEncodingAnomaly(std::string_view("ISO\0-10303", 10)));
  assert(HasEncodingAnomaly("name='\xEF\xBF\xBD'"));
  assert(HasEncodingAnomaly("ISO-10303-21;\nFILE_NAME('caf\xE9.ifc');"));
  assert(HasEncodingAnomaly("FILE_NAME('\x80');"));
  assert(HasEncodingAnomaly("FILE_NAME('\x80\x81');"));
  assert(HasEncodingAnomaly("overlong \xC0\xAF"));
  assert(HasEncodingAnomaly("surrogate \xED\xA0\x80"));
  assert(!HasEncodingAnomaly("FILE_NAME('caf\xC3\xA9.ifc');"));
  assert(!HasEncodingAnomaly("grad \xE2\x88\x86 \xF0\x9F\x99\x82"));
  // a sequence cut off at the end of the prefix window is not an anomaly
  assert(!HasEncodingAnomaly("FILE_NAME('caf\xC3"));
  assert(!HasEncodingAnomaly("edge \xE2\x88"));

  // profile of a small valid file
  auto small = WriteTemp("stepfrag_profile_small.ifc", stepfrag::testing::SampleStepFile(5));
  auto profile = Profile(small);
  assert(profile.path == small);
  assert(profile.size_bytes == std::filesystem::file_size(small));
  assert(profile.size_tier == SizeTier::kSmall);
  assert(profile.header_valid);
  assert(profile.schema_id == std::string("IFC4"));
  assert(!profile.encoding_anomaly);
  assert(profile.estimated_ram_mb == 1);
  assert(!profile.recommended_heap_mb.has_value());
  assert(profile.advisories.empty());
  auto report = FormatProfileReport(profile);
  assert(report.find("schema: IFC4") != std::string::npos);
  assert(report.find("valid ISO-10303-21") != std::string::npos);
  assert(report.find("tier: small") != std::string::npos);
  std::filesystem::remove(small);

  // a sparse 150 MiB file is profiled without reading it
  auto large = std::filesystem::temp_directory_path() / "stepfrag_profile_large.ifc";
  { std::ofstream touch(large, std::ios::binary | std::ios::trunc); }
  std::filesystem::resize_file(large, 150 * kMiB);
  auto big = Profile(large);
  assert(big.size_tier == SizeTier::kWarning);
  assert(!big.header_valid);
  assert(big.encoding_anomaly);
  assert(!big.schema_id.has_value());
  assert(big.estimated_ram_mb == 450);
  assert(big.recommended_heap_mb == 4096u);
  assert(big.advisories.size() == 2);
  auto big_report = FormatProfileReport(big);
  assert(big_report.find("tier: warning (>= 100 MB)") != std::string::npos);
  assert(big_report.find("[WARN] potential encoding issues") != std::string::npos);
  std::filesystem::remove(large);

  // missing file
  bool threw = false;
  try {
    (void)Profile(std::filesystem::temp_directory_path() / "stepfrag_missing_profile.ifc");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("not found") != std::string::npos;
  }
  assert(threw);

  std::cout << "file profiler tests ok\n";
  return 0;
}
