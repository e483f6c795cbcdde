// core/stream.hpp - Writable stream with direct or buffered output
#pragma once

#include "bridge.hpp"
#include "entry.hpp"
#include "file_handle.hpp"
#include "runner.hpp"
#include "scratch.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace safio {

// Collaborators a stream needs after construction. All of them must
// outlive the stream; the pool must also outlive any implicit disposal it
// schedules.
struct StreamContext {
  Bridge *bridge;
  ScratchFiles *scratch;
  Runner *runner;
  WorkerPool *pool;
};

class WritableStream {
public:
  // Writes land at the target through its own handle
  struct Direct {
    FileHandle handle;
  };
  // Writes land in a scratch file copied to the target on reflect
  struct Buffered {
    FileHandle handle;
    fs::path scratch_path;
    EntryRef target;
  };
  struct Disposed {};

  using State = std::variant<Direct, Buffered, Disposed>;

  WritableStream(const StreamContext &ctx, State state);
  ~WritableStream();

  WritableStream(WritableStream &&other) noexcept;
  WritableStream &operator=(WritableStream &&other) noexcept;
  WritableStream(const WritableStream &) = delete;
  WritableStream &operator=(const WritableStream &) = delete;

  void write(const void *data, size_t len);
  void write(const std::string &data) { write(data.data(), data.size()); }
  void write(const std::vector<uint8_t> &data) {
    write(data.data(), data.size());
  }
  void flush();

  // No-ops for buffered streams; the scratch file is synced on reflect
  void sync_all();
  void sync_data();

  // Copies buffered data to the target and removes the scratch file. Every
  // step runs; the first failure is thrown and later ones are logged.
  void reflect();
  // Drops the output. The target keeps its previous contents.
  void dispose_without_reflect();

  bool is_buffered() const { return std::holds_alternative<Buffered>(state_); }
  bool is_disposed() const { return std::holds_alternative<Disposed>(state_); }

private:
  FileHandle &active_handle(const char *op);
  // Hands a live state over to the worker pool for a best-effort reflect
  void dispose_implicitly() noexcept;

  StreamContext ctx_;
  State state_;
};

// Shared by reflect() and implicit disposal
void reflect_buffered(WritableStream::Buffered &buffered, Bridge &bridge,
                      ScratchFiles &scratch, Runner &runner);

} // namespace safio
