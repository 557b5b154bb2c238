#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "stepfrag/file_handle.hpp"

namespace stepfrag {

struct StreamState {
  // -1 until the first request. Informational; completion is decided on the
  // unsigned offsets.
  std::int64_t last_offset = -1;
  bool finished = false;
  std::uint64_t requests = 0;
  std::uint64_t bytes_served = 0;
};

struct ChunkReaderOptions {
  // Treat the first request whose offset is below the previous one as the
  // consumer's final pass.
  bool infer_completion = true;
  std::function<void()> on_finished;
  std::function<void(std::uint64_t bytes_served)> on_read;
};

// Pull-based adapter over one open handle. Serves exactly one conversion;
// not thread-safe and not reentrant. The handle stays owned by the caller.
class ChunkedReader {
 public:
  explicit ChunkedReader(FileHandle& handle, ChunkReaderOptions options = {});

  ChunkedReader(const ChunkedReader&) = delete;
  ChunkedReader& operator=(const ChunkedReader&) = delete;

  // One bounded read at offset. A short or empty result means end of data.
  [[nodiscard]] std::vector<std::uint8_t> Read(std::uint64_t offset, std::uint32_t size);

  // Explicit completion signal for consumers that know when they are done.
  void MarkFinished();

  [[nodiscard]] bool finished() const noexcept { return state_.finished; }
  [[nodiscard]] const StreamState& state() const noexcept { return state_; }

 private:
  void SetFinished();

  FileHandle& handle_;
  ChunkReaderOptions options_;
  StreamState state_;
  bool has_previous_ = false;
  std::uint64_t previous_offset_ = 0;
};

}  // namespace stepfrag
