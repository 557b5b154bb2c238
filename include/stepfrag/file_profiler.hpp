#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stepfrag {

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;
inline constexpr std::size_t kProfilePrefixBytes = 1024;
inline constexpr std::string_view kStepMagic = "ISO-10303-21;";

inline constexpr std::uint64_t kWarningTierBytes = 100 * kMiB;
inline constexpr std::uint64_t kCriticalTierBytes = 500 * kMiB;
inline constexpr std::uint64_t kLargeHeapBytes = 200 * kMiB;
inline constexpr std::uint64_t kMediumHeapBytes = 50 * kMiB;
inline constexpr std::uint64_t kLargeHeapMb = 8192;
inline constexpr std::uint64_t kMediumHeapMb = 4096;

enum class SizeTier {
  kSmall,
  kWarning,
  kCritical,
};

struct FileProfile {
  std::filesystem::path path;
  std::uint64_t size_bytes = 0;
  std::chrono::system_clock::time_point modified_at{};
  SizeTier size_tier = SizeTier::kSmall;
  bool header_valid = false;
  std::optional<std::string> schema_id;
  bool encoding_anomaly = false;
  std::uint64_t estimated_ram_mb = 0;
  std::optional<std::uint64_t> recommended_heap_mb;
  std::vector<std::string> advisories;
};

// One stat and one read of at most kProfilePrefixBytes, whatever the file size.
// Throws std::runtime_error when the path is missing or unreadable.
[[nodiscard]] FileProfile Profile(const std::filesystem::path& path);

[[nodiscard]] SizeTier ClassifySizeTier(std::uint64_t size_bytes) noexcept;
[[nodiscard]] const char* SizeTierName(SizeTier tier) noexcept;
[[nodiscard]] bool HasValidHeader(std::string_view prefix) noexcept;
[[nodiscard]] std::optional<std::string> ExtractSchemaId(std::string_view prefix);
[[nodiscard]] bool HasEncodingAnomaly(std::string_view prefix) noexcept;
[[nodiscard]] std::uint64_t EstimateRamMb(std::uint64_t size_bytes) noexcept;
[[nodiscard]] std::optional<std::uint64_t> RecommendedHeapMb(std::uint64_t size_bytes) noexcept;

[[nodiscard]] std::string FormatProfileReport(const FileProfile& profile);

}  // namespace stepfrag
