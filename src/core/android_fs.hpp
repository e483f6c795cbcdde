// core/android_fs.hpp - Storage access facade
#pragma once

#include "../conf/config.hpp"
#include "access.hpp"
#include "bridge.hpp"
#include "entry.hpp"
#include "resolver.hpp"
#include "runner.hpp"
#include "scratch.hpp"
#include "stream.hpp"
#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace safio {

// Scratch root resolver backed by the bridge's no-backup directory, or by
// scratch_base_dir when the config sets one
ScratchFiles::RootResolver make_scratch_resolver(Bridge &bridge, Runner &runner,
                                                 const Config &config);

// Consumer-facing operations. Every blocking step, bridge call or local
// syscall, goes through the runner given at construction, so the same
// facade serves the inline and the offloaded strategy.
class AndroidFs {
public:
  AndroidFs(Bridge &bridge, ScratchFiles &scratch, Runner &runner,
            WorkerPool &pool,
            std::vector<std::string> indirect_write_prefixes = {});

  int api_level() { return access_.api_level(); }
  // Throws UnsupportedPlatform when the platform is older than api_level
  void require_api_level(int api_level);

  // Providers whose raw descriptors drop writes need a buffered stream
  bool needs_indirect_write(const EntryRef &ref) const;

  EntryRef resolve(const EntryRef &base, const std::string &relative_path,
                   std::optional<EntryKind> expected = std::nullopt) {
    return resolver_.resolve(base, relative_path, expected);
  }
  EntryRef resolve_file(const EntryRef &base, const std::string &rel) {
    return resolver_.resolve_file(base, rel);
  }
  EntryRef resolve_dir(const EntryRef &base, const std::string &rel) {
    return resolver_.resolve_dir(base, rel);
  }
  EntryRef resolve_unchecked(const EntryRef &base, const std::string &rel) {
    return resolver_.resolve_unchecked(base, rel);
  }

  EntryKind get_entry_kind(const EntryRef &ref) {
    return resolver_.entry_kind(ref);
  }
  std::string get_name(const EntryRef &ref);
  uint64_t get_len(const EntryRef &ref);
  // Throws TypeMismatch for a directory
  std::string get_mime_type(const EntryRef &ref);
  Entry get_metadata(const EntryRef &ref);

  // Children of dir in provider order. Malformed records are skipped.
  std::vector<Entry> read_dir(const EntryRef &dir);

  // New empty file at relative_path under dir, creating missing parents. An
  // existing name gets a provider-chosen variant instead of being replaced.
  EntryRef create_new_file(const EntryRef &dir,
                           const std::string &relative_path,
                           std::optional<std::string> mime_type = std::nullopt);
  // Existing directories are returned as they are
  EntryRef create_dir_all(const EntryRef &dir,
                          const std::string &relative_path);
  // new_name is a single name including any extension
  EntryRef rename(const EntryRef &ref, const std::string &new_name);

  FileHandle open_file(const EntryRef &ref, AccessMode mode) {
    return access_.open(ref, mode);
  }
  std::pair<FileHandle, AccessMode>
  open_with_fallback(const EntryRef &ref, const std::vector<AccessMode> &modes) {
    return access_.open_with_fallback(ref, modes);
  }
  FileHandle open_writable(const EntryRef &ref) {
    return access_.open_writable(ref);
  }
  FileHandle open_readable(const EntryRef &ref) {
    return access_.open_readable(ref);
  }

  WritableStream create_writable_stream(const EntryRef &ref, bool via_bridge);
  WritableStream create_writable_stream_auto(const EntryRef &ref) {
    return create_writable_stream(ref, needs_indirect_write(ref));
  }
  WritableStream create_writable_stream_via_bridge(const EntryRef &ref) {
    return create_writable_stream(ref, true);
  }

  std::vector<uint8_t> read_file(const EntryRef &ref);
  std::string read_file_to_string(const EntryRef &ref);
  // Replaces the target's contents
  void write_file(const EntryRef &ref, const std::string &data);
  void copy_file(const EntryRef &src, const EntryRef &dest);
  void remove_file(const EntryRef &ref);
  // Fails unless the directory is empty
  void remove_dir(const EntryRef &ref);
  void remove_dir_all(const EntryRef &ref);

  ScratchFiles &scratch() { return scratch_; }
  Runner &runner() { return runner_; }

private:
  json::Value call(const char *command, const json::Value &payload);
  json::Value call_with_ref(const char *command, const EntryRef &ref);

  Bridge &bridge_;
  ScratchFiles &scratch_;
  Runner &runner_;
  WorkerPool &pool_;
  std::vector<std::string> indirect_write_prefixes_;
  PathResolver resolver_;
  AccessNegotiator access_;
};

// Offloaded strategy. The blocking steps of fs() run on the pool while the
// caller waits; the *_async forms return at once with a future.
class AsyncAndroidFs {
public:
  AsyncAndroidFs(Bridge &bridge, ScratchFiles &scratch, WorkerPool &pool,
                 std::vector<std::string> indirect_write_prefixes = {});

  AndroidFs &fs() { return fs_; }

  std::future<EntryRef> resolve_async(const EntryRef &base,
                                      std::string relative_path,
                                      std::optional<EntryKind> expected =
                                          std::nullopt);
  std::future<FileHandle> open_writable_async(const EntryRef &ref);
  std::future<std::vector<Entry>> read_dir_async(const EntryRef &dir);
  std::future<WritableStream> create_writable_stream_auto_async(
      const EntryRef &ref);
  std::future<std::vector<uint8_t>> read_file_async(const EntryRef &ref);
  std::future<void> write_file_async(const EntryRef &ref, std::string data);
  std::future<void> copy_file_async(const EntryRef &src, const EntryRef &dest);

private:
  WorkerPool &pool_;
  OffloadRunner runner_;
  AndroidFs fs_;
};

} // namespace safio
