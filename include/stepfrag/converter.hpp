#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "stepfrag/config.hpp"
#include "stepfrag/file_handle.hpp"
#include "stepfrag/fragment_parser.hpp"

namespace stepfrag {

inline constexpr const char* kResultMarker = "CONVERSION_RESULT_JSON:";

struct ConversionStats {
  std::uint64_t input_bytes = 0;
  std::uint64_t output_bytes = 0;
  double seconds = 0.0;
};

// Terminal outcome of one conversion. stats is set only on success, error
// only on failure; use the factories to keep that true.
struct ConversionResult {
  bool success = false;
  std::string message;
  std::optional<ConversionStats> stats;
  std::optional<std::string> error;

  static ConversionResult Success(std::string message, ConversionStats stats);
  static ConversionResult Failure(std::string message, std::string error);
};

[[nodiscard]] std::string FormatSizeMb(std::uint64_t bytes);
[[nodiscard]] std::string FormatCompressionRatio(std::uint64_t input_bytes, std::uint64_t output_bytes);
[[nodiscard]] std::string FormatSeconds(double seconds);

[[nodiscard]] nlohmann::json ToJson(const ConversionResult& result);
[[nodiscard]] std::string FormatResultLine(const ConversionResult& result);
// Returns the JSON payload if `line` is a result line.
[[nodiscard]] std::optional<nlohmann::json> ParseResultLine(const std::string& line);

// Same directory as input, extension replaced.
[[nodiscard]] std::filesystem::path DeriveOutputPath(const std::filesystem::path& input,
                                                     const std::string& extension = ".frag");

using HandleOpener = std::function<std::unique_ptr<FileHandle>(const std::filesystem::path&)>;
using ParserFactory = std::function<std::unique_ptr<FragmentParser>()>;

class Converter {
 public:
  explicit Converter(Config cfg, ParserFactory parser_factory = {}, HandleOpener opener = {},
                     std::ostream& out = std::cout, std::ostream& err = std::cerr);

  // Never throws. The input handle is closed exactly once whenever it was opened.
  [[nodiscard]] ConversionResult Convert(const std::filesystem::path& input_path,
                                         const std::filesystem::path& output_path) noexcept;

 private:
  ConversionResult ConvertOrThrow(const std::filesystem::path& input_path,
                                  const std::filesystem::path& output_path,
                                  std::chrono::steady_clock::time_point start);

  Config cfg_;
  ParserFactory parser_factory_;
  HandleOpener opener_;
  std::ostream& out_;
  std::ostream& err_;
};

void WriteArtifactFile(const std::filesystem::path& path, const Bytes& artifact);

}  // namespace stepfrag
