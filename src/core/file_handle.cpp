// core/file_handle.cpp - Owned file descriptor implementation
#include "file_handle.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace safio {

FileHandle::~FileHandle() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

FileHandle::FileHandle(FileHandle &&other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void FileHandle::write_all(const void *data, size_t len) {
  const char *p = static_cast<const char *>(data);
  while (len > 0) {
    ssize_t n = ::write(fd_, p, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw local_io_error("write failed", errno);
    }
    p += n;
    len -= static_cast<size_t>(n);
  }
}

void FileHandle::sync_data() {
  if (fdatasync(fd_) != 0) {
    throw local_io_error("fdatasync failed", errno);
  }
}

void FileHandle::sync_all() {
  if (fsync(fd_) != 0) {
    throw local_io_error("fsync failed", errno);
  }
}

void FileHandle::set_len(uint64_t len) {
  if (ftruncate(fd_, static_cast<off_t>(len)) != 0) {
    throw local_io_error("ftruncate failed", errno);
  }
}

uint64_t FileHandle::len() const {
  struct stat st;
  if (fstat(fd_, &st) != 0) {
    throw local_io_error("fstat failed", errno);
  }
  return static_cast<uint64_t>(st.st_size);
}

std::vector<uint8_t> FileHandle::read_to_end() {
  std::vector<uint8_t> buf;
  struct stat st;
  if (fstat(fd_, &st) == 0 && st.st_size > 0) {
    buf.reserve(static_cast<size_t>(st.st_size));
  }

  uint8_t chunk[8192];
  while (true) {
    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw local_io_error("read failed", errno);
    }
    if (n == 0)
      break;
    buf.insert(buf.end(), chunk, chunk + n);
  }
  return buf;
}

void FileHandle::close() {
  if (fd_ < 0) {
    return;
  }
  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0 && errno != EINTR) {
    throw local_io_error("close failed", errno);
  }
}

int FileHandle::release() {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

} // namespace safio
