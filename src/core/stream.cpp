// core/stream.cpp - Writable stream implementation
#include "stream.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <exception>
#include <functional>
#include <memory>

namespace safio {

namespace {

// Runs one cleanup step; keeps the first failure, logs the rest
void attempt_step(std::exception_ptr &first, Runner &runner, const char *what,
                  const char *step, const std::function<void()> &fn) {
  try {
    runner.run(fn);
  } catch (const std::exception &e) {
    if (first) {
      LOG_ERROR(std::string(what) + ": " + step + " failed: " + e.what());
    } else {
      LOG_DEBUG(std::string(what) + ": " + step + " failed: " + e.what());
      first = std::current_exception();
    }
  }
}

} // namespace

void reflect_buffered(WritableStream::Buffered &buffered, Bridge &bridge,
                      ScratchFiles &scratch, Runner &runner) {
  std::exception_ptr first;
  auto attempt = [&](const char *step, const std::function<void()> &fn) {
    attempt_step(first, runner, "reflect", step, fn);
  };

  attempt("sync scratch", [&buffered] {
    FileHandle handle = std::move(buffered.handle);
    if (handle) {
      handle.sync_data();
      handle.close();
    }
  });

  attempt("copy to target", [&] {
    json::Value payload = json::Value::object();
    payload["src"] = EntryRef::from_path(buffered.scratch_path).to_json();
    payload["dest"] = buffered.target.to_json();
    bridge.invoke(bridge_cmd::COPY_FILE, payload);
  });

  attempt("remove scratch",
          [&] { scratch.remove(buffered.scratch_path); });

  if (first)
    std::rethrow_exception(first);
}

WritableStream::WritableStream(const StreamContext &ctx, State state)
    : ctx_(ctx), state_(std::move(state)) {}

WritableStream::~WritableStream() { dispose_implicitly(); }

WritableStream::WritableStream(WritableStream &&other) noexcept
    : ctx_(other.ctx_), state_(std::move(other.state_)) {
  other.state_ = Disposed{};
}

WritableStream &WritableStream::operator=(WritableStream &&other) noexcept {
  if (this != &other) {
    dispose_implicitly();
    ctx_ = other.ctx_;
    state_ = std::move(other.state_);
    other.state_ = Disposed{};
  }
  return *this;
}

FileHandle &WritableStream::active_handle(const char *op) {
  if (auto *direct = std::get_if<Direct>(&state_))
    return direct->handle;
  if (auto *buffered = std::get_if<Buffered>(&state_))
    return buffered->handle;
  throw Error(ErrorKind::InvalidState,
              std::string("Cannot ") + op + " a disposed stream");
}

void WritableStream::write(const void *data, size_t len) {
  FileHandle &handle = active_handle("write to");
  ctx_.runner->run([&] { handle.write_all(data, len); });
}

void WritableStream::flush() {
  FileHandle &handle = active_handle("flush");
  ctx_.runner->run([&] { handle.sync_data(); });
}

void WritableStream::sync_all() {
  active_handle("sync");
  if (auto *direct = std::get_if<Direct>(&state_)) {
    ctx_.runner->run([direct] { direct->handle.sync_all(); });
  }
}

void WritableStream::sync_data() {
  active_handle("sync");
  if (auto *direct = std::get_if<Direct>(&state_)) {
    ctx_.runner->run([direct] { direct->handle.sync_data(); });
  }
}

void WritableStream::reflect() {
  State state = std::move(state_);
  state_ = Disposed{};

  if (auto *direct = std::get_if<Direct>(&state)) {
    FileHandle handle = std::move(direct->handle);
    ctx_.runner->run([&handle] { handle.close(); });
  } else if (auto *buffered = std::get_if<Buffered>(&state)) {
    reflect_buffered(*buffered, *ctx_.bridge, *ctx_.scratch, *ctx_.runner);
  }
}

void WritableStream::dispose_without_reflect() {
  State state = std::move(state_);
  state_ = Disposed{};

  if (auto *direct = std::get_if<Direct>(&state)) {
    FileHandle handle = std::move(direct->handle);
    ctx_.runner->run([&handle] { handle.close(); });
  } else if (auto *buffered = std::get_if<Buffered>(&state)) {
    std::exception_ptr first;
    attempt_step(first, *ctx_.runner, "dispose", "close scratch", [buffered] {
      FileHandle handle = std::move(buffered->handle);
      handle.close();
    });
    attempt_step(first, *ctx_.runner, "dispose", "remove scratch",
                 [this, buffered] { ctx_.scratch->remove(buffered->scratch_path); });
    if (first)
      std::rethrow_exception(first);
  }
}

void WritableStream::dispose_implicitly() noexcept {
  if (std::holds_alternative<Disposed>(state_))
    return;

  if (auto *direct = std::get_if<Direct>(&state_)) {
    // Closing is all a direct stream needs; the data is already in place
    FileHandle handle = std::move(direct->handle);
    state_ = Disposed{};
    return;
  }

  Bridge &bridge = *ctx_.bridge;
  ScratchFiles &scratch = *ctx_.scratch;
  try {
    auto buffered =
        std::make_shared<Buffered>(std::move(std::get<Buffered>(state_)));
    state_ = Disposed{};
    ctx_.pool->submit([buffered, &bridge, &scratch] {
      InlineRunner inline_runner;
      try {
        reflect_buffered(*buffered, bridge, scratch, inline_runner);
        LOG_DEBUG("Implicitly reflected stream to " + buffered->target.uri);
      } catch (const std::exception &e) {
        LOG_WARN("Implicit reflect to " + buffered->target.uri +
                 " failed: " + e.what());
      }
    });
  } catch (const std::exception &e) {
    state_ = Disposed{};
    LOG_ERROR(std::string("Failed to schedule implicit reflect: ") + e.what());
  }
}

} // namespace safio
