#include "stepfrag/file_profiler.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>

namespace stepfrag {

namespace {

constexpr std::string_view kSchemaKeyword = "FILE_SCHEMA";
constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

bool EqualsIgnoreCase(std::string_view text, std::size_t pos, std::string_view word) {
  if (text.size() - pos < word.size()) {
    return false;
  }
  for (std::size_t i = 0; i < word.size(); ++i) {
    char a = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos + i])));
    char b = static_cast<char>(std::toupper(static_cast<unsigned char>(word[i])));
    if (a != b) {
      return false;
    }
  }
  return true;
}

void SkipSpace(std::string_view text, std::size_t& pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
}

bool Expect(std::string_view text, std::size_t& pos, char ch) {
  if (pos < text.size() && text[pos] == ch) {
    ++pos;
    return true;
  }
  return false;
}

// Matches `( '<literal>' )` after the keyword; only whitespace is allowed
// between the keyword and the outer parenthesis.
std::optional<std::string> MatchSchemaAt(std::string_view text, std::size_t pos) {
  SkipSpace(text, pos);
  if (!Expect(text, pos, '(')) {
    return std::nullopt;
  }
  SkipSpace(text, pos);
  if (!Expect(text, pos, '(') || !Expect(text, pos, '\'')) {
    return std::nullopt;
  }
  std::size_t close = text.find('\'', pos);
  if (close == std::string_view::npos || close == pos) {
    return std::nullopt;
  }
  std::size_t after = close + 1;
  if (!Expect(text, after, ')')) {
    return std::nullopt;
  }
  return std::string(text.substr(pos, close - pos));
}

// Length of the well-formed UTF-8 sequence starting at pos, 0 if malformed.
// A sequence cut off by the end of the window counts as well-formed.
std::size_t Utf8SequenceLength(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    return 1;
  }
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0) {
      lo = 0xA0;
    } else if (lead == 0xED) {
      hi = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0) {
      lo = 0x90;
    } else if (lead == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }
  for (std::size_t i = 1; i < len; ++i) {
    if (pos + i >= text.size()) {
      return text.size() - pos;
    }
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if (i == 1 ? (cont < lo || cont > hi) : (cont < 0x80 || cont > 0xBF)) {
      return 0;
    }
  }
  return len;
}

bool IsWellFormedUtf8(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t len = Utf8SequenceLength(text, pos);
    if (len == 0) {
      return false;
    }
    pos += len;
  }
  return true;
}

std::string FormatMb(std::uint64_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / static_cast<double>(kMiB);
  return oss.str();
}

std::string FormatUtc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
    return "unknown";
  }
  return buf;
}

}  // namespace

SizeTier ClassifySizeTier(std::uint64_t size_bytes) noexcept {
  if (size_bytes >= kCriticalTierBytes) {
    return SizeTier::kCritical;
  }
  if (size_bytes >= kWarningTierBytes) {
    return SizeTier::kWarning;
  }
  return SizeTier::kSmall;
}

const char* SizeTierName(SizeTier tier) noexcept {
  switch (tier) {
    case SizeTier::kSmall:
      return "small";
    case SizeTier::kWarning:
      return "warning";
    case SizeTier::kCritical:
      return "critical";
  }
  return "unknown";
}

bool HasValidHeader(std::string_view prefix) noexcept {
  return prefix.size() >= kStepMagic.size() && prefix.compare(0, kStepMagic.size(), kStepMagic) == 0;
}

std::optional<std::string> ExtractSchemaId(std::string_view prefix) {
  for (std::size_t pos = 0; pos + kSchemaKeyword.size() <= prefix.size(); ++pos) {
    if (!EqualsIgnoreCase(prefix, pos, kSchemaKeyword)) {
      continue;
    }
    if (auto schema = MatchSchemaAt(prefix, pos + kSchemaKeyword.size())) {
      return schema;
    }
  }
  return std::nullopt;
}

bool HasEncodingAnomaly(std::string_view prefix) noexcept {
  return prefix.find('\0') != std::string_view::npos || prefix.find(kReplacementChar) != std::string_view::npos ||
         !IsWellFormedUtf8(prefix);
}

std::uint64_t EstimateRamMb(std::uint64_t size_bytes) noexcept {
  // ceil(size_mb * 3) without going through floating point.
  const std::uint64_t whole = size_bytes / kMiB;
  const std::uint64_t rest = size_bytes % kMiB;
  return whole * 3 + (rest * 3 + kMiB - 1) / kMiB;
}

std::optional<std::uint64_t> RecommendedHeapMb(std::uint64_t size_bytes) noexcept {
  if (size_bytes > kLargeHeapBytes) {
    return kLargeHeapMb;
  }
  if (size_bytes > kMediumHeapBytes) {
    return kMediumHeapMb;
  }
  return std::nullopt;
}

FileProfile Profile(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw std::runtime_error("file not found: " + path.string());
    }
    throw std::runtime_error("failed to stat " + path.string() + ": " + std::strerror(err));
  }
  if (S_ISDIR(st.st_mode)) {
    throw std::runtime_error("not a regular file: " + path.string());
  }

  FileProfile profile;
  profile.path = path;
  profile.size_bytes = static_cast<std::uint64_t>(st.st_size);
  profile.modified_at = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open file: " + path.string());
  }
  std::string prefix(kProfilePrefixBytes, '\0');
  in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
  if (in.bad()) {
    throw std::runtime_error("failed to read header: " + path.string());
  }
  prefix.resize(static_cast<std::size_t>(in.gcount()));

  profile.size_tier = ClassifySizeTier(profile.size_bytes);
  profile.header_valid = HasValidHeader(prefix);
  profile.schema_id = ExtractSchemaId(prefix);
  profile.encoding_anomaly = HasEncodingAnomaly(prefix);
  profile.estimated_ram_mb = EstimateRamMb(profile.size_bytes);
  profile.recommended_heap_mb = RecommendedHeapMb(profile.size_bytes);

  if (profile.size_bytes > kLargeHeapBytes) {
    profile.advisories = {
        "increase parser heap to " + std::to_string(kLargeHeapMb) + " MB",
        "use streaming conversion",
        "consider file preprocessing",
    };
  } else if (profile.size_bytes > kMediumHeapBytes) {
    profile.advisories = {
        "increase parser heap to " + std::to_string(kMediumHeapMb) + " MB",
        "monitor memory usage",
    };
  }
  return profile;
}

std::string FormatProfileReport(const FileProfile& profile) {
  std::ostringstream oss;
  oss << "[PROFILE] " << profile.path.string() << "\n";
  oss << "  size: " << FormatMb(profile.size_bytes) << " MB\n";
  oss << "  modified: " << FormatUtc(profile.modified_at) << "\n";
  oss << "  tier: " << SizeTierName(profile.size_tier);
  switch (profile.size_tier) {
    case SizeTier::kCritical:
      oss << " (>= 500 MB), may exhaust memory, requires streaming/chunked processing\n";
      break;
    case SizeTier::kWarning:
      oss << " (>= 100 MB), may require increased memory limits\n";
      break;
    case SizeTier::kSmall:
      oss << ", size appears manageable\n";
      break;
  }
  oss << "  schema: " << profile.schema_id.value_or("unknown") << "\n";
  if (profile.encoding_anomaly) {
    oss << "  [WARN] potential encoding issues detected in header\n";
  }
  oss << "  header: " << (profile.header_valid ? "valid ISO-10303-21" : "invalid, missing ISO-10303-21 header")
      << "\n";
  if (!profile.advisories.empty()) {
    oss << "  recommendations:\n";
    for (const auto& advice : profile.advisories) {
      oss << "    - " << advice << "\n";
    }
  }
  oss << "  estimated RAM: ~" << profile.estimated_ram_mb << " MB\n";
  return oss.str();
}

}  // namespace stepfrag
