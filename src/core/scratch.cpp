// core/scratch.cpp - Scratch file manager implementation
#include "scratch.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace safio {

ScratchFiles::ScratchFiles(RootResolver resolver, IdSource ids,
                           std::shared_ptr<ScratchLock> lock)
    : resolver_(std::move(resolver)), next_id_(std::move(ids)),
      lock_(lock ? std::move(lock) : std::make_shared<ScratchLock>()) {}

ScratchFiles::IdSource ScratchFiles::process_counter() {
  static std::atomic<uint64_t> counter{0};
  return [] { return counter.fetch_add(1, std::memory_order_relaxed); };
}

const fs::path &ScratchFiles::temp_root() {
  {
    std::lock_guard<std::mutex> guard(root_mutex_);
    if (root_)
      return *root_;
  }

  // The resolver may go through a runner, so no lock is held across it
  fs::path base = resolver_();
  if (base.empty()) {
    throw Error(ErrorKind::LocalIoFailure,
                "Private no-backup directory is not available");
  }

  std::lock_guard<std::mutex> guard(root_mutex_);
  if (!root_) {
    root_ = base / SCRATCH_DIR_NAME;
    LOG_DEBUG("Scratch root: " + root_->string());
  }
  return *root_;
}

ScratchFile ScratchFiles::create() {
  // Resolving may reach the bridge, so it happens before taking the lock
  fs::path root = temp_root();
  uint64_t id = next_id_();
  fs::path path = root / std::to_string(id);

  std::lock_guard<ScratchLock> guard(*lock_);

  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    throw local_io_error("Failed to create scratch directory " + root.string(),
                         ec.value());
  }

  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw local_io_error("Failed to create scratch file " + path.string(),
                         errno);
  }

  return ScratchFile{id, path, FileHandle(fd)};
}

void ScratchFiles::sweep_all() {
  fs::path root = temp_root();

  std::lock_guard<ScratchLock> guard(*lock_);

  std::error_code ec;
  auto removed = fs::remove_all(root, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw local_io_error("Failed to sweep scratch directory " + root.string(),
                         ec.value());
  }
  if (removed > 0) {
    LOG_DEBUG("Swept " + std::to_string(removed) + " scratch entries");
  }
}

void ScratchFiles::remove(const fs::path &path) {
  if (::unlink(path.c_str()) != 0) {
    throw local_io_error("Failed to remove scratch file " + path.string(),
                         errno);
  }
}

} // namespace safio
