// core/android_fs.cpp - Storage access facade implementation
#include "android_fs.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"

namespace safio {

ScratchFiles::RootResolver make_scratch_resolver(Bridge &bridge, Runner &runner,
                                                 const Config &config) {
  fs::path override_dir = config.scratch_base_dir;
  return [&bridge, &runner, override_dir]() -> fs::path {
    if (!override_dir.empty()) {
      return override_dir;
    }
    json::Value res = runner.run([&bridge] {
      return bridge.invoke(bridge_cmd::GET_PRIVATE_DIRS,
                           json::Value::object());
    });
    if (!res.get("noBackupData").is_string()) {
      throw Error(ErrorKind::BridgeInvocationFailed,
                  "getPrivateBaseDirAbsolutePaths returned no noBackupData");
    }
    return fs::path(res.at("noBackupData").as_string());
  };
}

AndroidFs::AndroidFs(Bridge &bridge, ScratchFiles &scratch, Runner &runner,
                     WorkerPool &pool,
                     std::vector<std::string> indirect_write_prefixes)
    : bridge_(bridge), scratch_(scratch), runner_(runner), pool_(pool),
      indirect_write_prefixes_(std::move(indirect_write_prefixes)),
      resolver_(bridge, runner), access_(bridge, runner) {}

json::Value AndroidFs::call(const char *command, const json::Value &payload) {
  return runner_.run([&] { return bridge_.invoke(command, payload); });
}

json::Value AndroidFs::call_with_ref(const char *command,
                                     const EntryRef &ref) {
  json::Value payload = json::Value::object();
  payload["uri"] = ref.to_json();
  return call(command, payload);
}

// Bridge answers are trusted for shape only as far as they parse
static EntryRef ref_from_response(const json::Value &res, const char *command,
                                  const EntryRef &parent) {
  EntryRef ref;
  try {
    ref = EntryRef::from_json(res);
  } catch (const Error &e) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                std::string(command) + " returned no reference: " + e.what());
  }
  if (!ref.root_grant)
    ref.root_grant = parent.root_grant;
  return ref;
}

static std::string join_segments(const std::vector<std::string> &segments) {
  std::string out;
  for (const auto &segment : segments) {
    if (!out.empty())
      out += '/';
    out += segment;
  }
  return out;
}

void AndroidFs::require_api_level(int required) {
  int current = api_level();
  if (required <= current) {
    return;
  }
  throw Error(ErrorKind::UnsupportedPlatform,
              "Requires Android API level " + std::to_string(required) +
                  " or higher, but the platform is at " +
                  std::to_string(current));
}

bool AndroidFs::needs_indirect_write(const EntryRef &ref) const {
  for (const auto &prefix : INDIRECT_WRITE_PREFIXES) {
    if (starts_with(ref.uri, prefix))
      return true;
  }
  for (const auto &prefix : indirect_write_prefixes_) {
    if (starts_with(ref.uri, prefix))
      return true;
  }
  return false;
}

std::string AndroidFs::get_name(const EntryRef &ref) {
  json::Value res = call_with_ref(bridge_cmd::GET_NAME, ref);
  if (!res.get("name").is_string()) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getName returned no name for " + ref.uri);
  }
  return res.at("name").as_string();
}

uint64_t AndroidFs::get_len(const EntryRef &ref) {
  json::Value res = call_with_ref(bridge_cmd::GET_LEN, ref);
  if (!res.get("len").is_number()) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getLen returned no length for " + ref.uri);
  }
  return static_cast<uint64_t>(res.at("len").as_int());
}

std::string AndroidFs::get_mime_type(const EntryRef &ref) {
  json::Value res = call_with_ref(bridge_cmd::GET_MIME_TYPE, ref);
  if (!res.get("value").is_string()) {
    throw Error(ErrorKind::TypeMismatch, "This is not a file: " + ref.uri);
  }
  return res.at("value").as_string();
}

Entry AndroidFs::get_metadata(const EntryRef &ref) {
  json::Value res = call_with_ref(bridge_cmd::GET_METADATA, ref);
  try {
    Entry entry = Entry::from_json(res);
    if (!entry.ref.root_grant)
      entry.ref.root_grant = ref.root_grant;
    return entry;
  } catch (const Error &e) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "getMetadata returned a malformed entry for " + ref.uri +
                    ": " + e.what());
  }
}

std::vector<Entry> AndroidFs::read_dir(const EntryRef &dir) {
  json::Value res = call_with_ref(bridge_cmd::READ_DIR, dir);
  if (!res.get("entries").is_array()) {
    throw Error(ErrorKind::BridgeInvocationFailed,
                "readDir returned no entries for " + dir.uri);
  }

  std::vector<Entry> entries;
  for (const auto &item : res.at("entries").as_array()) {
    try {
      Entry entry = Entry::from_json(item);
      if (!entry.ref.root_grant)
        entry.ref.root_grant = dir.root_grant;
      entries.push_back(std::move(entry));
    } catch (const Error &e) {
      LOG_WARN("Skipping malformed entry in " + dir.uri + ": " + e.what());
    }
  }
  return entries;
}

EntryRef AndroidFs::create_new_file(const EntryRef &dir,
                                    const std::string &relative_path,
                                    std::optional<std::string> mime_type) {
  std::vector<std::string> segments = split_relative_path(relative_path);
  if (segments.empty()) {
    throw Error(ErrorKind::InvalidRelativePath,
                "A file name is required under " + dir.uri);
  }

  json::Value payload = json::Value::object();
  payload["dir"] = dir.to_json();
  payload["relativePath"] = json::Value(join_segments(segments));
  payload["mimeType"] = mime_type ? json::Value(*mime_type) : json::Value();
  return ref_from_response(call(bridge_cmd::CREATE_FILE, payload),
                           bridge_cmd::CREATE_FILE, dir);
}

EntryRef AndroidFs::create_dir_all(const EntryRef &dir,
                                   const std::string &relative_path) {
  std::vector<std::string> segments = split_relative_path(relative_path);
  if (segments.empty()) {
    return dir;
  }

  json::Value payload = json::Value::object();
  payload["dir"] = dir.to_json();
  payload["relativePath"] = json::Value(join_segments(segments));
  return ref_from_response(call(bridge_cmd::CREATE_DIR_ALL, payload),
                           bridge_cmd::CREATE_DIR_ALL, dir);
}

EntryRef AndroidFs::rename(const EntryRef &ref, const std::string &new_name) {
  if (new_name.empty() || new_name == "." || new_name == ".." ||
      new_name.find('/') != std::string::npos) {
    throw Error(ErrorKind::InvalidArgument,
                "Invalid entry name '" + new_name + "'");
  }

  json::Value payload = json::Value::object();
  payload["uri"] = ref.to_json();
  payload["newName"] = json::Value(new_name);
  return ref_from_response(call(bridge_cmd::RENAME, payload),
                           bridge_cmd::RENAME, ref);
}

WritableStream AndroidFs::create_writable_stream(const EntryRef &ref,
                                                 bool via_bridge) {
  StreamContext ctx{&bridge_, &scratch_, &runner_, &pool_};

  if (!via_bridge) {
    FileHandle handle = access_.open_writable(ref);
    return WritableStream(ctx, WritableStream::Direct{std::move(handle)});
  }

  // The root may need the bridge, so resolve it outside the scratch lock
  scratch_.temp_root();
  ScratchFile file = runner_.run([this] { return scratch_.create(); });
  LOG_DEBUG("Buffering writes to " + ref.uri + " in " + file.path.string());
  return WritableStream(ctx, WritableStream::Buffered{std::move(file.handle),
                                                      file.path, ref});
}

std::vector<uint8_t> AndroidFs::read_file(const EntryRef &ref) {
  FileHandle handle = access_.open_readable(ref);
  return runner_.run([&handle] { return handle.read_to_end(); });
}

std::string AndroidFs::read_file_to_string(const EntryRef &ref) {
  std::vector<uint8_t> bytes = read_file(ref);
  return std::string(bytes.begin(), bytes.end());
}

void AndroidFs::write_file(const EntryRef &ref, const std::string &data) {
  WritableStream stream = create_writable_stream_auto(ref);
  try {
    stream.write(data);
  } catch (const std::exception &) {
    stream.dispose_without_reflect();
    throw;
  }
  stream.reflect();
}

void AndroidFs::copy_file(const EntryRef &src, const EntryRef &dest) {
  json::Value payload = json::Value::object();
  payload["src"] = src.to_json();
  payload["dest"] = dest.to_json();
  call(bridge_cmd::COPY_FILE, payload);
}

void AndroidFs::remove_file(const EntryRef &ref) {
  call_with_ref(bridge_cmd::DELETE_FILE, ref);
}

void AndroidFs::remove_dir(const EntryRef &ref) {
  call_with_ref(bridge_cmd::DELETE_EMPTY_DIR, ref);
}

void AndroidFs::remove_dir_all(const EntryRef &ref) {
  call_with_ref(bridge_cmd::DELETE_DIR_ALL, ref);
}

AsyncAndroidFs::AsyncAndroidFs(Bridge &bridge, ScratchFiles &scratch,
                               WorkerPool &pool,
                               std::vector<std::string> indirect_write_prefixes)
    : pool_(pool), runner_(pool),
      fs_(bridge, scratch, runner_, pool, std::move(indirect_write_prefixes)) {}

std::future<EntryRef>
AsyncAndroidFs::resolve_async(const EntryRef &base, std::string relative_path,
                              std::optional<EntryKind> expected) {
  return pool_.spawn([this, base, relative_path, expected] {
    return fs_.resolve(base, relative_path, expected);
  });
}

std::future<FileHandle>
AsyncAndroidFs::open_writable_async(const EntryRef &ref) {
  return pool_.spawn([this, ref] { return fs_.open_writable(ref); });
}

std::future<std::vector<Entry>>
AsyncAndroidFs::read_dir_async(const EntryRef &dir) {
  return pool_.spawn([this, dir] { return fs_.read_dir(dir); });
}

std::future<WritableStream>
AsyncAndroidFs::create_writable_stream_auto_async(const EntryRef &ref) {
  return pool_.spawn(
      [this, ref] { return fs_.create_writable_stream_auto(ref); });
}

std::future<std::vector<uint8_t>>
AsyncAndroidFs::read_file_async(const EntryRef &ref) {
  return pool_.spawn([this, ref] { return fs_.read_file(ref); });
}

std::future<void> AsyncAndroidFs::write_file_async(const EntryRef &ref,
                                                   std::string data) {
  return pool_.spawn([this, ref, data] { fs_.write_file(ref, data); });
}

std::future<void> AsyncAndroidFs::copy_file_async(const EntryRef &src,
                                                  const EntryRef &dest) {
  return pool_.spawn([this, src, dest] { fs_.copy_file(src, dest); });
}

} // namespace safio
