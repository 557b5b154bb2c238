#include "stepfrag/file_handle.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stepfrag {

namespace {
std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}
}  // namespace

PosixFileHandle::PosixFileHandle(const std::filesystem::path& path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    throw std::runtime_error(ErrnoMessage("failed to open", path_, errno));
  }
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error(ErrnoMessage("failed to stat", path_, err));
  }
  size_ = static_cast<std::uint64_t>(st.st_size);
}

PosixFileHandle::~PosixFileHandle() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::size_t PosixFileHandle::ReadAt(std::uint64_t offset, std::uint8_t* dst, std::size_t size) {
  if (fd_ < 0) {
    throw std::runtime_error("read on closed handle: " + path_.string());
  }
  while (true) {
    ssize_t n = ::pread(fd_, dst, size, static_cast<off_t>(offset));
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno != EINTR) {
      throw std::runtime_error(ErrnoMessage("failed to read", path_, errno));
    }
  }
}

void PosixFileHandle::Close() {
  if (fd_ < 0) {
    return;
  }
  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) {
    throw std::runtime_error(ErrnoMessage("failed to close", path_, errno));
  }
}

std::unique_ptr<FileHandle> OpenFileHandle(const std::filesystem::path& path) {
  return std::make_unique<PosixFileHandle>(path);
}

}  // namespace stepfrag
