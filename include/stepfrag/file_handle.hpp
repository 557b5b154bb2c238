#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace stepfrag {

// Random-access read handle. Close() is explicit so callers can observe a
// failing close; implementations release silently on destruction otherwise.
class FileHandle {
 public:
  virtual ~FileHandle() = default;

  // One positioned read. Returns the number of bytes copied into dst, which
  // is less than size at end of file. Throws std::runtime_error on I/O error.
  virtual std::size_t ReadAt(std::uint64_t offset, std::uint8_t* dst, std::size_t size) = 0;

  [[nodiscard]] virtual std::uint64_t Size() const = 0;

  // Throws std::runtime_error if the underlying close fails.
  virtual void Close() = 0;
};

class PosixFileHandle final : public FileHandle {
 public:
  explicit PosixFileHandle(const std::filesystem::path& path);
  ~PosixFileHandle() override;

  PosixFileHandle(const PosixFileHandle&) = delete;
  PosixFileHandle& operator=(const PosixFileHandle&) = delete;

  std::size_t ReadAt(std::uint64_t offset, std::uint8_t* dst, std::size_t size) override;
  [[nodiscard]] std::uint64_t Size() const override { return size_; }
  void Close() override;

 private:
  std::filesystem::path path_;
  int fd_ = -1;
  std::uint64_t size_ = 0;
};

[[nodiscard]] std::unique_ptr<FileHandle> OpenFileHandle(const std::filesystem::path& path);

}  // namespace stepfrag
