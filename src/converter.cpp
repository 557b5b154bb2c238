#include "stepfrag/converter.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "stepfrag/chunk_reader.hpp"
#include "stepfrag/fragment_packer.hpp"
#include "stepfrag/progress.hpp"

namespace stepfrag {

namespace {

std::string Fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

// Closes the handle when the conversion scope unwinds; a failing close is
// reported and otherwise ignored.
class HandleCloser {
 public:
  HandleCloser(FileHandle& handle, std::ostream& err) : handle_(handle), err_(err) {}
  HandleCloser(const HandleCloser&) = delete;
  HandleCloser& operator=(const HandleCloser&) = delete;
  ~HandleCloser() {
    try {
      handle_.Close();
    } catch (const std::exception& e) {
      err_ << "[WARN] Could not close file handle: " << e.what() << "\n";
    }
  }

 private:
  FileHandle& handle_;
  std::ostream& err_;
};

}  // namespace

ConversionResult ConversionResult::Success(std::string message, ConversionStats stats) {
  ConversionResult r;
  r.success = true;
  r.message = std::move(message);
  r.stats = stats;
  return r;
}

ConversionResult ConversionResult::Failure(std::string message, std::string error) {
  ConversionResult r;
  r.success = false;
  r.message = std::move(message);
  r.error = std::move(error);
  return r;
}

std::string FormatSizeMb(std::uint64_t bytes) {
  return Fixed(static_cast<double>(bytes) / (1024.0 * 1024.0), 2);
}

std::string FormatCompressionRatio(std::uint64_t input_bytes, std::uint64_t output_bytes) {
  if (input_bytes == 0) {
    return "0.0%";
  }
  double ratio = (1.0 - static_cast<double>(output_bytes) / static_cast<double>(input_bytes)) * 100.0;
  return Fixed(ratio, 1) + "%";
}

std::string FormatSeconds(double seconds) {
  return Fixed(seconds, 2);
}

nlohmann::json ToJson(const ConversionResult& result) {
  nlohmann::json j;
  j["success"] = result.success;
  j["message"] = result.message;
  if (result.success && result.stats) {
    const auto& s = *result.stats;
    j["stats"] = {
        {"inputSizeMB", FormatSizeMb(s.input_bytes)},
        {"outputSizeMB", FormatSizeMb(s.output_bytes)},
        {"compressionRatio", FormatCompressionRatio(s.input_bytes, s.output_bytes)},
        {"conversionTimeSeconds", FormatSeconds(s.seconds)},
    };
  }
  if (!result.success && result.error) {
    j["error"] = *result.error;
  }
  return j;
}

std::string FormatResultLine(const ConversionResult& result) {
  // File names are not guaranteed to be UTF-8; invalid bytes become U+FFFD.
  return std::string(kResultMarker) + " " +
         ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<nlohmann::json> ParseResultLine(const std::string& line) {
  const std::string marker(kResultMarker);
  if (line.compare(0, marker.size(), marker) != 0) {
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(line.substr(marker.size()), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  return j;
}

std::filesystem::path DeriveOutputPath(const std::filesystem::path& input, const std::string& extension) {
  std::filesystem::path out = input;
  out.replace_extension(extension);
  return out;
}

void WriteArtifactFile(const std::filesystem::path& path, const Bytes& artifact) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open output file: " + path.string());
  }
  out.write(reinterpret_cast<const char*>(artifact.data()), static_cast<std::streamsize>(artifact.size()));
  out.close();
  if (!out) {
    throw std::runtime_error("failed to write output file: " + path.string());
  }
}

Converter::Converter(Config cfg, ParserFactory parser_factory, HandleOpener opener, std::ostream& out,
                     std::ostream& err)
    : cfg_(std::move(cfg)),
      parser_factory_(std::move(parser_factory)),
      opener_(std::move(opener)),
      out_(out),
      err_(err) {
  if (!parser_factory_) {
    auto packer_options = PackerOptionsFromConfig(cfg_);
    parser_factory_ = [packer_options] { return std::make_unique<FragmentPacker>(packer_options); };
  }
  if (!opener_) {
    opener_ = [](const std::filesystem::path& path) { return OpenFileHandle(path); };
  }
}

ConversionResult Converter::Convert(const std::filesystem::path& input_path,
                                    const std::filesystem::path& output_path) noexcept {
  const auto start = std::chrono::steady_clock::now();
  const std::string name = input_path.filename().string();
  std::string reason;
  try {
    return ConvertOrThrow(input_path, output_path, start);
  } catch (const std::exception& e) {
    reason = e.what();
  } catch (...) {
    reason = "unknown exception";
  }
  std::string message = "Failed to convert " + name + ": " + reason;
  err_ << "[ERROR] " << message << "\n";
  return ConversionResult::Failure(std::move(message), std::move(reason));
}

ConversionResult Converter::ConvertOrThrow(const std::filesystem::path& input_path,
                                           const std::filesystem::path& output_path,
                                           std::chrono::steady_clock::time_point start) {
  const std::string name = input_path.filename().string();
  out_ << "[START] Starting conversion: " << name << "\n";

  std::error_code ec;
  if (!std::filesystem::exists(input_path, ec) || ec) {
    throw std::runtime_error("input file not found: " + input_path.string());
  }
  const std::uint64_t input_bytes = std::filesystem::file_size(input_path);
  out_ << "[INFO] File size: " << FormatSizeMb(input_bytes) << " MB\n";

  Bytes artifact;
  {
    std::unique_ptr<FileHandle> handle = opener_(input_path);
    if (!handle) {
      throw std::runtime_error("failed to open input file: " + input_path.string());
    }
    HandleCloser closer(*handle, err_);

    ProgressTracker progress(out_, "READ", handle->Size(), cfg_.progress_interval_ms);
    ChunkReaderOptions reader_options;
    reader_options.infer_completion = cfg_.infer_completion;
    reader_options.on_finished = [this] { out_ << "[INFO] File reading completed, starting conversion...\n"; };
    reader_options.on_read = [&progress](std::uint64_t served) { progress.Update(served); };
    ChunkedReader reader(*handle, std::move(reader_options));

    auto parser = parser_factory_();
    if (!parser) {
      throw std::runtime_error("parser factory returned no parser");
    }
    out_ << "[PROCESS] Processing geometry and properties...\n";
    artifact = parser->Process(
        [&reader](std::uint64_t offset, std::uint32_t size) { return reader.Read(offset, size); });
    reader.MarkFinished();
    progress.Finish();
  }

  out_ << "[SAVE] Writing fragments file: " << output_path.filename().string() << "\n";
  WriteArtifactFile(output_path, artifact);
  const auto end = std::chrono::steady_clock::now();

  ConversionStats stats;
  stats.input_bytes = input_bytes;
  stats.output_bytes = artifact.size();
  stats.seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start).count();

  out_ << "[OK] Conversion completed successfully\n";
  out_ << "   [STATS] Input: " << FormatSizeMb(stats.input_bytes) << " MB -> Output: "
       << FormatSizeMb(stats.output_bytes) << " MB\n";
  out_ << "   [COMPRESS] Compression: " << FormatCompressionRatio(stats.input_bytes, stats.output_bytes) << "\n";
  out_ << "   [TIME] Time: " << FormatSeconds(stats.seconds) << "s\n";

  return ConversionResult::Success("Successfully converted " + name + " to fragments", stats);
}

}  // namespace stepfrag
