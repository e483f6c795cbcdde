// core/scratch.hpp - Process-private scratch files
#pragma once

#include "file_handle.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace fs = std::filesystem;

namespace safio {

// Serializes scratch creation against the bulk sweep. Held only around
// local filesystem syscalls, never across a bridge call.
class ScratchLock {
public:
  virtual ~ScratchLock() = default;
  virtual void lock() { mutex_.lock(); }
  virtual void unlock() { mutex_.unlock(); }

private:
  std::mutex mutex_;
};

struct ScratchFile {
  uint64_t id = 0;
  fs::path path;
  FileHandle handle;
};

class ScratchFiles {
public:
  // Returns the private no-backup directory the scratch root lives in
  using RootResolver = std::function<fs::path()>;
  using IdSource = std::function<uint64_t()>;

  explicit ScratchFiles(RootResolver resolver,
                        IdSource ids = process_counter(),
                        std::shared_ptr<ScratchLock> lock = nullptr);

  ScratchFiles(const ScratchFiles &) = delete;
  ScratchFiles &operator=(const ScratchFiles &) = delete;

  // Resolved on first use and cached; a failed resolution is retried
  const fs::path &temp_root();

  // New empty file named after the next id, opened read-write, created
  // exclusively
  ScratchFile create();

  // Deletes the whole scratch tree. A missing tree is not an error.
  void sweep_all();

  void remove(const fs::path &path);

  // Process-wide monotonic counter shared by every ScratchFiles instance
  static IdSource process_counter();

private:
  RootResolver resolver_;
  IdSource next_id_;
  std::shared_ptr<ScratchLock> lock_;
  std::mutex root_mutex_;
  std::optional<fs::path> root_;
};

} // namespace safio
