#include <iostream>
#include <memory>

#include "stepfrag/converter.hpp"
#include "stepfrag/file_profiler.hpp"
#include "stepfrag/fragment_packer.hpp"

// Profiles a model, then converts it with xz at a custom chunk size.
int main(int argc, char** argv) {
  using namespace stepfrag;

  if (argc < 2) {
    std::cerr << "usage: stepfrag_example <model.ifc>\n";
    return 1;
  }
  const std::filesystem::path input = argv[1];

  try {
    auto profile = Profile(input);
    std::cout << FormatProfileReport(profile);
    if (!profile.header_valid) {
      std::cout << "continuing despite invalid header\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "profile failed: " << e.what() << "\n";
    return 1;
  }

  Config cfg;
  cfg.codec = Codec::kXz;
  cfg.level = 6;
  cfg.chunk_bytes = 4 << 20;
  auto packer_options = PackerOptionsFromConfig(cfg);
  Converter converter(cfg, [packer_options] { return std::make_unique<FragmentPacker>(packer_options); });

  auto result = converter.Convert(input, DeriveOutputPath(input, ".xz.frag"));
  std::cout << ToJson(result).dump(2) << '\n';
  return result.success ? 0 : 1;
}
