#include "stepfrag/chunk_reader.hpp"

#include <utility>

namespace stepfrag {

ChunkedReader::ChunkedReader(FileHandle& handle, ChunkReaderOptions options)
    : handle_(handle), options_(std::move(options)) {}

std::vector<std::uint8_t> ChunkedReader::Read(std::uint64_t offset, std::uint32_t size) {
  if (!state_.finished && options_.infer_completion && has_previous_ && offset < previous_offset_) {
    SetFinished();
  }
  has_previous_ = true;
  previous_offset_ = offset;
  state_.last_offset = static_cast<std::int64_t>(offset);
  ++state_.requests;

  std::vector<std::uint8_t> data(size);
  std::size_t got = 0;
  if (size > 0) {
    got = handle_.ReadAt(offset, data.data(), data.size());
  }
  data.resize(got);
  state_.bytes_served += got;
  if (options_.on_read) {
    options_.on_read(state_.bytes_served);
  }
  return data;
}

void ChunkedReader::MarkFinished() {
  if (!state_.finished) {
    SetFinished();
  }
}

void ChunkedReader::SetFinished() {
  state_.finished = true;
  if (options_.on_finished) {
    options_.on_finished();
  }
}

}  // namespace stepfrag
