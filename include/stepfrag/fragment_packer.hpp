#pragma once

#include <cstddef>
#include <cstdint>

#include "stepfrag/config.hpp"
#include "stepfrag/fragment_parser.hpp"

namespace stepfrag {

inline constexpr std::uint32_t kArtifactMagic = 0x47524653;  // "SFRG"
inline constexpr std::uint16_t kArtifactVersion = 1;
inline constexpr std::size_t kArtifactHeaderBytes = 32;

struct ArtifactHeader {
  std::uint32_t magic = kArtifactMagic;
  std::uint16_t version = kArtifactVersion;
  Codec codec = Codec::kDeflate;
  std::uint64_t entity_count = 0;
  std::uint64_t source_bytes = 0;
  std::uint64_t payload_bytes = 0;
};

struct PackerOptions {
  Codec codec = Codec::kDeflate;
  int level = 6;
  std::uint32_t chunk_bytes = 1 << 20;
};

[[nodiscard]] PackerOptions PackerOptionsFromConfig(const Config& cfg);

// Two-pass packer: a scan pass counting entity instances, then a second pass
// from offset 0 that streams the bytes through the codec.
class FragmentPacker final : public FragmentParser {
 public:
  explicit FragmentPacker(PackerOptions options = {});

  [[nodiscard]] Bytes Process(const ReadFn& read) override;

 private:
  struct ScanResult {
    std::uint64_t bytes = 0;
    std::uint64_t entities = 0;
  };

  [[nodiscard]] ScanResult Scan(const ReadFn& read) const;
  [[nodiscard]] Bytes PackDeflate(const ReadFn& read, std::uint64_t expected) const;
  [[nodiscard]] Bytes PackXz(const ReadFn& read, std::uint64_t expected) const;

  PackerOptions options_;
};

void WriteArtifactHeader(const ArtifactHeader& header, std::uint8_t* dst);

// Throws std::runtime_error on a short buffer, bad magic, unknown version or
// codec, or a payload length that disagrees with the buffer.
[[nodiscard]] ArtifactHeader ReadArtifactHeader(const Bytes& artifact);

}  // namespace stepfrag
