// core/file_handle.hpp - Owned file descriptor
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace safio {

// Owns one descriptor obtained from the bridge or from open(2).
// Move-only; closes on destruction.
class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();

  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;
  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;

  int fd() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  explicit operator bool() const { return valid(); }

  // All of these throw LocalIoFailure
  void write_all(const void *data, size_t len);
  void sync_data();
  void sync_all();
  void set_len(uint64_t len);
  uint64_t len() const;
  std::vector<uint8_t> read_to_end();
  void close();

  int release();

private:
  int fd_ = -1;
};

} // namespace safio
