// core/entry.hpp - Entry references and access modes
#pragma once

#include "json.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace safio {

// Opaque provider reference: a file:// or content:// URI, plus the tree
// grant it descends from when it was derived from a picked directory
struct EntryRef {
  std::string uri;
  std::optional<std::string> root_grant;

  static EntryRef from_path(const fs::path &path);
  static EntryRef from_json(const json::Value &value);
  static EntryRef from_string(const std::string &text);

  // Path of a file:// reference, nullopt otherwise
  std::optional<fs::path> as_path() const;
  bool is_file_uri() const;

  json::Value to_json() const;
  std::string to_string() const;

  bool operator==(const EntryRef &other) const { return uri == other.uri; }
  bool operator!=(const EntryRef &other) const { return uri != other.uri; }
};

enum class EntryKind { File, Dir };

const char *entry_kind_name(EntryKind kind);

// Listing or metadata record for one entry. Directories carry no MIME type
// and a zero length.
struct Entry {
  EntryRef ref;
  std::string name;
  EntryKind kind = EntryKind::File;
  std::string mime_type;
  uint64_t len = 0;
  std::optional<int64_t> last_modified_ms;

  // Throws InvalidArgument when uri or name is missing
  static Entry from_json(const json::Value &value);
};

// Platform open intents. Write never guarantees truncation since Android 10.
enum class AccessMode {
  Read,
  Write,
  WriteTruncate,
  WriteAppend,
  ReadWrite,
  ReadWriteTruncate,
};

const char *access_mode_string(AccessMode mode);
AccessMode access_mode_from_string(const std::string &mode);
bool is_truncating(AccessMode mode);

} // namespace safio
