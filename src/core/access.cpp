// core/access.cpp - Open mode negotiation implementation
#include "access.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"

namespace safio {

int AccessNegotiator::api_level() {
  {
    std::lock_guard<std::mutex> lock(api_mutex_);
    if (api_level_)
      return *api_level_;
  }

  // Queried without the lock: under an offload runner the call may wait
  // behind a queued step that needs the level too
  json::Value res = runner_.run([this] {
    return bridge_.invoke(bridge_cmd::GET_CONSTS, json::Value::object());
  });
  if (!res.get("buildVersionSdkInt").is_number()) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getConsts returned no buildVersionSdkInt");
  }
  int level = static_cast<int>(res.at("buildVersionSdkInt").as_int());

  std::lock_guard<std::mutex> lock(api_mutex_);
  if (!api_level_) {
    api_level_ = level;
    LOG_DEBUG("Platform API level: " + std::to_string(level));
  }
  return *api_level_;
}

FileHandle AccessNegotiator::open(const EntryRef &ref, AccessMode mode) {
  json::Value payload = json::Value::object();
  payload["uri"] = ref.to_json();
  payload["mode"] = json::Value(access_mode_string(mode));

  json::Value res = runner_.run(
      [&] { return bridge_.invoke(bridge_cmd::GET_FILE_DESCRIPTOR, payload); });
  if (!res.get("fd").is_number()) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getFileDescriptor returned no descriptor for " + ref.uri);
  }
  int64_t fd = res.at("fd").as_int();
  if (fd < 0) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getFileDescriptor returned invalid descriptor " +
                    std::to_string(fd) + " for " + ref.uri);
  }
  return FileHandle(static_cast<int>(fd));
}

std::pair<FileHandle, AccessMode>
AccessNegotiator::open_with_fallback(const EntryRef &ref,
                                     const std::vector<AccessMode> &modes) {
  if (modes.empty()) {
    throw Error(ErrorKind::InvalidArgument,
                "No access mode given to open " + ref.uri);
  }

  std::vector<ModeExhaustedError::Attempt> attempts;
  for (AccessMode mode : modes) {
    try {
      FileHandle handle = open(ref, mode);
      return {std::move(handle), mode};
    } catch (const Error &e) {
      LOG_DEBUG(std::string("Mode '") + access_mode_string(mode) +
                "' failed for " + ref.uri + ": " + e.what());
      attempts.emplace_back(access_mode_string(mode), e.what());
    }
  }
  throw ModeExhaustedError(ref.uri, std::move(attempts));
}

FileHandle AccessNegotiator::open_writable(const EntryRef &ref) {
  // "w" truncates up to Android 9
  if (api_level() <= API_LEVEL_ANDROID_9) {
    return open(ref, AccessMode::Write);
  }

  auto opened = open_with_fallback(
      ref, {AccessMode::WriteTruncate, AccessMode::ReadWriteTruncate,
            AccessMode::Write});
  FileHandle handle = std::move(opened.first);

  if (opened.second == AccessMode::Write) {
    runner_.run([&handle] { handle.set_len(0); });
  }
  return handle;
}

} // namespace safio
