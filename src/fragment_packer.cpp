#include "stepfrag/fragment_packer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <lzma.h>
#include <zlib.h>

namespace stepfrag {

namespace {

constexpr std::size_t kOutChunk = 1 << 16;

void PutLe(std::uint8_t* dst, std::uint64_t value, std::size_t width) {
  for (std::size_t i = 0; i < width; ++i) {
    dst[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
  }
}

std::uint64_t GetLe(const std::uint8_t* src, std::size_t width) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value |= static_cast<std::uint64_t>(src[i]) << (8 * i);
  }
  return value;
}

// Counts `#<digits> =` at the start of a line, across chunk boundaries.
class EntityCounter {
 public:
  void Feed(const Bytes& data) {
    for (std::uint8_t c : data) {
      Step(static_cast<char>(c));
    }
  }
  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

 private:
  enum class State { kLineStart, kHash, kDigits, kSpaceAfterId, kOther };

  void Step(char c) {
    if (c == '\n') {
      state_ = State::kLineStart;
      return;
    }
    const bool space = c == ' ' || c == '\t' || c == '\r';
    switch (state_) {
      case State::kLineStart:
        if (c == '#') {
          state_ = State::kHash;
        } else if (!space) {
          state_ = State::kOther;
        }
        break;
      case State::kHash:
        state_ = (c >= '0' && c <= '9') ? State::kDigits : State::kOther;
        break;
      case State::kDigits:
        if (c >= '0' && c <= '9') {
          break;
        }
        if (c == '=') {
          ++count_;
          state_ = State::kOther;
        } else {
          state_ = space ? State::kSpaceAfterId : State::kOther;
        }
        break;
      case State::kSpaceAfterId:
        if (c == '=') {
          ++count_;
          state_ = State::kOther;
        } else if (!space) {
          state_ = State::kOther;
        }
        break;
      case State::kOther:
        break;
    }
  }

  State state_ = State::kLineStart;
  std::uint64_t count_ = 0;
};

struct DeflateStream {
  z_stream strm{};
  bool live = false;
  ~DeflateStream() {
    if (live) {
      deflateEnd(&strm);
    }
  }
};

struct XzStream {
  lzma_stream strm = LZMA_STREAM_INIT;
  ~XzStream() { lzma_end(&strm); }
};

void CheckSourceSize(std::uint64_t packed, std::uint64_t expected) {
  if (packed != expected) {
    throw std::runtime_error("source changed during conversion: scanned " + std::to_string(expected) +
                             " bytes, packed " + std::to_string(packed));
  }
}

}  // namespace

PackerOptions PackerOptionsFromConfig(const Config& cfg) {
  PackerOptions opts;
  opts.codec = cfg.codec;
  opts.level = std::clamp(cfg.level, 0, 9);
  opts.chunk_bytes = static_cast<std::uint32_t>(std::clamp<std::size_t>(cfg.chunk_bytes, 1, 0xFFFFFFFFu));
  return opts;
}

FragmentPacker::FragmentPacker(PackerOptions options) : options_(options) {
  if (options_.chunk_bytes == 0) {
    throw std::invalid_argument("packer chunk size must be positive");
  }
  if (options_.level < 0 || options_.level > 9) {
    throw std::invalid_argument("packer level must be within 0-9");
  }
}

Bytes FragmentPacker::Process(const ReadFn& read) {
  const auto scan = Scan(read);
  if (scan.bytes == 0) {
    throw std::runtime_error("input stream is empty");
  }

  Bytes artifact = options_.codec == Codec::kXz ? PackXz(read, scan.bytes) : PackDeflate(read, scan.bytes);

  ArtifactHeader header;
  header.codec = options_.codec;
  header.entity_count = scan.entities;
  header.source_bytes = scan.bytes;
  header.payload_bytes = artifact.size() - kArtifactHeaderBytes;
  WriteArtifactHeader(header, artifact.data());
  return artifact;
}

FragmentPacker::ScanResult FragmentPacker::Scan(const ReadFn& read) const {
  ScanResult result;
  EntityCounter counter;
  while (true) {
    Bytes chunk = read(result.bytes, options_.chunk_bytes);
    counter.Feed(chunk);
    result.bytes += chunk.size();
    if (chunk.size() < options_.chunk_bytes) {
      break;
    }
  }
  result.entities = counter.count();
  return result;
}

Bytes FragmentPacker::PackDeflate(const ReadFn& read, std::uint64_t expected) const {
  DeflateStream ds;
  if (deflateInit(&ds.strm, options_.level) != Z_OK) {
    throw std::runtime_error("deflateInit failed");
  }
  ds.live = true;

  Bytes out(kArtifactHeaderBytes, 0);
  std::vector<std::uint8_t> buf(kOutChunk);
  std::uint64_t offset = 0;
  bool last = false;
  while (!last) {
    Bytes chunk = read(offset, options_.chunk_bytes);
    offset += chunk.size();
    last = chunk.size() < options_.chunk_bytes;

    ds.strm.next_in = chunk.data();
    ds.strm.avail_in = static_cast<uInt>(chunk.size());
    const int flush = last ? Z_FINISH : Z_NO_FLUSH;
    int ret = Z_OK;
    do {
      ds.strm.next_out = buf.data();
      ds.strm.avail_out = static_cast<uInt>(buf.size());
      ret = deflate(&ds.strm, flush);
      if (ret == Z_STREAM_ERROR) {
        throw std::runtime_error("deflate failed");
      }
      out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(buf.size() - ds.strm.avail_out));
    } while (ds.strm.avail_out == 0);
    if (last && ret != Z_STREAM_END) {
      throw std::runtime_error("deflate did not finish the stream");
    }
  }
  CheckSourceSize(offset, expected);
  return out;
}

Bytes FragmentPacker::PackXz(const ReadFn& read, std::uint64_t expected) const {
  XzStream xs;
  if (lzma_easy_encoder(&xs.strm, static_cast<std::uint32_t>(options_.level), LZMA_CHECK_CRC64) != LZMA_OK) {
    throw std::runtime_error("lzma_easy_encoder failed");
  }

  Bytes out(kArtifactHeaderBytes, 0);
  std::vector<std::uint8_t> buf(kOutChunk);
  std::uint64_t offset = 0;
  bool last = false;
  while (!last) {
    Bytes chunk = read(offset, options_.chunk_bytes);
    offset += chunk.size();
    last = chunk.size() < options_.chunk_bytes;

    xs.strm.next_in = chunk.data();
    xs.strm.avail_in = chunk.size();
    const lzma_action action = last ? LZMA_FINISH : LZMA_RUN;
    while (true) {
      xs.strm.next_out = buf.data();
      xs.strm.avail_out = buf.size();
      lzma_ret ret = lzma_code(&xs.strm, action);
      out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(buf.size() - xs.strm.avail_out));
      if (ret == LZMA_STREAM_END) {
        break;
      }
      if (ret != LZMA_OK) {
        throw std::runtime_error("lzma_code failed with code " + std::to_string(static_cast<int>(ret)));
      }
      if (action == LZMA_RUN && xs.strm.avail_in == 0 && xs.strm.avail_out != 0) {
        break;
      }
    }
  }
  CheckSourceSize(offset, expected);
  return out;
}

void WriteArtifactHeader(const ArtifactHeader& header, std::uint8_t* dst) {
  PutLe(dst, header.magic, 4);
  PutLe(dst + 4, header.version, 2);
  dst[6] = static_cast<std::uint8_t>(header.codec);
  dst[7] = 0;
  PutLe(dst + 8, header.entity_count, 8);
  PutLe(dst + 16, header.source_bytes, 8);
  PutLe(dst + 24, header.payload_bytes, 8);
}

ArtifactHeader ReadArtifactHeader(const Bytes& artifact) {
  if (artifact.size() < kArtifactHeaderBytes) {
    throw std::runtime_error("artifact shorter than header");
  }
  const std::uint8_t* p = artifact.data();
  ArtifactHeader header;
  header.magic = static_cast<std::uint32_t>(GetLe(p, 4));
  if (header.magic != kArtifactMagic) {
    throw std::runtime_error("bad artifact magic");
  }
  header.version = static_cast<std::uint16_t>(GetLe(p + 4, 2));
  if (header.version != kArtifactVersion) {
    throw std::runtime_error("unsupported artifact version " + std::to_string(header.version));
  }
  const auto codec = p[6];
  if (codec != static_cast<std::uint8_t>(Codec::kDeflate) && codec != static_cast<std::uint8_t>(Codec::kXz)) {
    throw std::runtime_error("unknown artifact codec " + std::to_string(codec));
  }
  header.codec = static_cast<Codec>(codec);
  header.entity_count = GetLe(p + 8, 8);
  header.source_bytes = GetLe(p + 16, 8);
  header.payload_bytes = GetLe(p + 24, 8);
  if (header.payload_bytes != artifact.size() - kArtifactHeaderBytes) {
    throw std::runtime_error("artifact payload length mismatch");
  }
  return header;
}

}  // namespace stepfrag
