// core/local_bridge.cpp - Host bridge implementation
#include "local_bridge.hpp"
#include "../utils.hpp"
#include "entry.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <map>
#include <sys/stat.h>
#include <unistd.h>

namespace safio {

static Error bridge_error(const std::string &message) {
  return Error(ErrorKind::BridgeInvocationFailed, message);
}

static fs::path require_path(const json::Value &payload, const char *key) {
  EntryRef ref = EntryRef::from_json(payload.get(key));
  auto path = ref.as_path();
  if (!path) {
    throw bridge_error("Unsupported reference for the host bridge: " +
                       ref.uri);
  }
  return *path;
}

static json::Value mime_type_of(const fs::path &path) {
  static const std::map<std::string, std::string> MIME_TYPES = {
      {".txt", "text/plain"},       {".json", "application/json"},
      {".html", "text/html"},       {".csv", "text/csv"},
      {".png", "image/png"},        {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},      {".webp", "image/webp"},
      {".gif", "image/gif"},        {".mp3", "audio/mpeg"},
      {".mp4", "video/mp4"},        {".pdf", "application/pdf"},
      {".zip", "application/zip"},
  };

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return json::Value();
  }
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = MIME_TYPES.find(ext);
  return json::Value(it == MIME_TYPES.end() ? "application/octet-stream"
                                            : it->second);
}

static std::string require_string(const json::Value &payload, const char *key) {
  if (!payload.get(key).is_string()) {
    throw bridge_error(std::string("Missing '") + key + "' string");
  }
  return payload.at(key).as_string();
}

// Listing record for a file or directory: uri, name, lastModified and, for
// files only, mimeType and len
static json::Value entry_json(const fs::path &path) {
  struct stat st;
  // A dangling symlink is still listed
  if (::stat(path.c_str(), &st) != 0 && ::lstat(path.c_str(), &st) != 0) {
    throw bridge_error("No file or permission: " + path.string() + ": " +
                       errno_string(errno));
  }
  json::Value obj = json::Value::object();
  obj["uri"] = EntryRef::from_path(path).to_json();
  obj["name"] = json::Value(path.filename().string());
  obj["lastModified"] =
      json::Value(static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
                  static_cast<int64_t>(st.st_mtim.tv_nsec / 1000000));
  obj["mimeType"] = mime_type_of(path);
  if (!S_ISDIR(st.st_mode)) {
    obj["len"] = json::Value(static_cast<int64_t>(st.st_size));
  }
  return obj;
}

// "name.ext" -> "name(1).ext", "name(2).ext", ... until one is free
static fs::path first_free_name(const fs::path &wanted) {
  std::error_code ec;
  if (!fs::exists(wanted, ec))
    return wanted;
  std::string stem = wanted.stem().string();
  std::string ext = wanted.extension().string();
  for (int counter = 1;; ++counter) {
    fs::path candidate = wanted.parent_path() /
                         (stem + "(" + std::to_string(counter) + ")" + ext);
    if (!fs::exists(candidate, ec))
      return candidate;
  }
}

LocalBridge::LocalBridge(LocalBridgeOptions options)
    : options_(std::move(options)) {}

json::Value LocalBridge::invoke(const std::string &command,
                                const json::Value &payload) {
  LOG_DEBUG("bridge: " + command + " " + json::dump(payload));
  try {
    return dispatch(command, payload);
  } catch (const Error &e) {
    if (e.kind() == ErrorKind::BridgeInvocationFailed)
      throw;
    // Malformed payloads are reported the way the platform side would
    throw bridge_error(e.what());
  }
}

json::Value LocalBridge::dispatch(const std::string &command,
                                  const json::Value &payload) const {
  if (command == bridge_cmd::GET_CONSTS)
    return get_consts();
  if (command == bridge_cmd::GET_PRIVATE_DIRS)
    return get_private_dirs();
  if (command == bridge_cmd::GET_FILE_DESCRIPTOR)
    return open_descriptor(payload);
  if (command == bridge_cmd::COPY_FILE)
    return copy_file(payload);
  if (command == bridge_cmd::READ_DIR)
    return read_dir(payload);
  if (command == bridge_cmd::GET_MIME_TYPE)
    return get_mime_type(payload);
  if (command == bridge_cmd::GET_NAME)
    return get_name(payload);
  if (command == bridge_cmd::GET_LEN)
    return get_len(payload);
  if (command == bridge_cmd::GET_METADATA)
    return get_metadata(payload);
  if (command == bridge_cmd::CREATE_FILE)
    return create_file(payload);
  if (command == bridge_cmd::CREATE_DIR_ALL)
    return create_dir_all(payload);
  if (command == bridge_cmd::RENAME)
    return rename(payload);
  if (command == bridge_cmd::DELETE_FILE)
    return delete_file(payload);
  if (command == bridge_cmd::DELETE_EMPTY_DIR)
    return delete_empty_dir(payload);
  if (command == bridge_cmd::DELETE_DIR_ALL)
    return delete_dir_all(payload);

  throw bridge_error("Unknown bridge command: " + command);
}

json::Value LocalBridge::get_consts() const {
  json::Value res = json::Value::object();
  res["buildVersionSdkInt"] = json::Value(options_.api_level);
  return res;
}

json::Value LocalBridge::get_private_dirs() const {
  json::Value res = json::Value::object();
  res["data"] = json::Value(options_.data_dir.string());
  res["cache"] = json::Value(options_.cache_dir.string());
  res["noBackupData"] = json::Value(options_.no_backup_dir.string());
  return res;
}

json::Value LocalBridge::open_descriptor(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  if (!payload.get("mode").is_string()) {
    throw bridge_error("getFileDescriptor requires a mode");
  }
  AccessMode mode = access_mode_from_string(payload.at("mode").as_string());

  int flags = O_CLOEXEC;
  switch (mode) {
  case AccessMode::Read:
    flags |= O_RDONLY;
    break;
  case AccessMode::Write:
    flags |= O_WRONLY | O_CREAT;
    if (options_.api_level <= API_LEVEL_ANDROID_9)
      flags |= O_TRUNC;
    break;
  case AccessMode::WriteTruncate:
    flags |= O_WRONLY | O_CREAT | O_TRUNC;
    break;
  case AccessMode::WriteAppend:
    flags |= O_WRONLY | O_CREAT | O_APPEND;
    break;
  case AccessMode::ReadWrite:
    flags |= O_RDWR | O_CREAT;
    break;
  case AccessMode::ReadWriteTruncate:
    flags |= O_RDWR | O_CREAT | O_TRUNC;
    break;
  }

  int fd = ::open(path.c_str(), flags, 0660);
  if (fd < 0) {
    throw bridge_error("Failed to open " + path.string() + ": " +
                       errno_string(errno));
  }

  json::Value res = json::Value::object();
  res["fd"] = json::Value(fd);
  return res;
}

json::Value LocalBridge::copy_file(const json::Value &payload) const {
  fs::path src = require_path(payload, "src");
  fs::path dest = require_path(payload, "dest");

  std::error_code ec;
  if (!fs::is_regular_file(src, ec)) {
    throw bridge_error("No file or permission: " + src.string());
  }
  fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw bridge_error("Failed to copy " + src.string() + " to " +
                       dest.string() + ": " + ec.message());
  }
  return json::Value::object();
}

json::Value LocalBridge::read_dir(const json::Value &payload) const {
  fs::path dir = require_path(payload, "uri");

  json::Value entries = json::Value::array();
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw bridge_error("Failed to read directory " + dir.string() + ": " +
                       ec.message());
  }
  const fs::directory_iterator end;
  while (it != end) {
    entries.push_back(entry_json(it->path()));
    it.increment(ec);
    if (ec) {
      throw bridge_error("Failed to read directory " + dir.string() + ": " +
                         ec.message());
    }
  }

  json::Value res = json::Value::object();
  res["entries"] = entries;
  return res;
}

json::Value LocalBridge::get_mime_type(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw bridge_error("No file or permission: " + path.string());
  }
  json::Value res = json::Value::object();
  res["value"] = mime_type_of(path);
  return res;
}

json::Value LocalBridge::get_name(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  json::Value res = json::Value::object();
  res["name"] = json::Value(path.filename().string());
  return res;
}

json::Value LocalBridge::get_len(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) {
    throw bridge_error("Failed to get length of " + path.string() + ": " +
                       ec.message());
  }
  json::Value res = json::Value::object();
  res["len"] = json::Value(static_cast<int64_t>(size));
  return res;
}

json::Value LocalBridge::delete_file(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    throw bridge_error("Not a file: " + path.string());
  }
  if (!fs::remove(path, ec) || ec) {
    throw bridge_error("Failed to delete " + path.string() +
                       (ec ? ": " + ec.message() : ""));
  }
  return json::Value::object();
}

json::Value LocalBridge::get_metadata(const json::Value &payload) const {
  return entry_json(require_path(payload, "uri"));
}

json::Value LocalBridge::create_file(const json::Value &payload) const {
  fs::path dir = require_path(payload, "dir");
  std::string relative_path = require_string(payload, "relativePath");
  while (!relative_path.empty() && relative_path.front() == '/')
    relative_path.erase(0, 1);
  if (relative_path.empty()) {
    throw bridge_error("createFile requires a file name");
  }

  fs::path path = first_free_name(dir / relative_path);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw bridge_error("Failed to create " + path.parent_path().string() +
                       ": " + ec.message());
  }
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0660);
  if (fd < 0) {
    throw bridge_error("Failed to create " + path.string() + ": " +
                       errno_string(errno));
  }
  ::close(fd);
  return EntryRef::from_path(path).to_json();
}

json::Value LocalBridge::create_dir_all(const json::Value &payload) const {
  fs::path dir = require_path(payload, "dir");
  std::string relative_path = require_string(payload, "relativePath");
  fs::path path = dir / relative_path;

  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec || !fs::is_directory(path, ec)) {
    throw bridge_error("Failed to create directory " + path.string() +
                       (ec ? ": " + ec.message() : ""));
  }
  return EntryRef::from_path(path).to_json();
}

json::Value LocalBridge::rename(const json::Value &payload) const {
  EntryRef ref = EntryRef::from_json(payload.get("uri"));
  fs::path path = require_path(payload, "uri");
  std::string new_name = require_string(payload, "newName");
  fs::path target = path.parent_path() / new_name;

  std::error_code ec;
  if (fs::exists(target, ec)) {
    throw bridge_error("File already exists: " + target.string());
  }
  fs::rename(path, target, ec);
  if (ec) {
    throw bridge_error("Failed to rename " + path.string() + ": " +
                       ec.message());
  }
  EntryRef renamed = EntryRef::from_path(target);
  renamed.root_grant = ref.root_grant;
  return renamed.to_json();
}

json::Value LocalBridge::delete_empty_dir(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    throw bridge_error("Not a directory: " + path.string());
  }
  if (!fs::remove(path, ec) || ec) {
    throw bridge_error("Failed to delete " + path.string() +
                       (ec ? ": " + ec.message() : ""));
  }
  return json::Value::object();
}

json::Value LocalBridge::delete_dir_all(const json::Value &payload) const {
  fs::path path = require_path(payload, "uri");
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    throw bridge_error("Not a directory: " + path.string());
  }
  fs::remove_all(path, ec);
  if (ec) {
    throw bridge_error("Failed to delete " + path.string() + ": " +
                       ec.message());
  }
  return json::Value::object();
}

std::unique_ptr<Bridge> open_host_bridge(const Config &config) {
#ifndef __ANDROID__
  if (!config.emulate_host) {
    throw Error(ErrorKind::UnsupportedPlatform,
                "This host is not running Android. Enable emulate_host to "
                "serve file:// references locally.");
  }
#endif

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec) / "safio-host";
  if (ec) {
    root = fs::path(BASE_DIR) / "host";
  }

  LocalBridgeOptions options;
  options.api_level = config.api_level;
  options.data_dir = root / "files";
  options.cache_dir = root / "cache";
  options.no_backup_dir = root / "no_backup";
  return std::make_unique<LocalBridge>(options);
}

} // namespace safio
