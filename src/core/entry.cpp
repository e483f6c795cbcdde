// core/entry.cpp - Entry references and access modes implementation
#include "entry.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"

namespace safio {

EntryRef EntryRef::from_path(const fs::path &path) {
  return EntryRef{std::string(FILE_SCHEME) + path.string(), std::nullopt};
}

EntryRef EntryRef::from_json(const json::Value &value) {
  if (!value.is_object() || !value.get("uri").is_string()) {
    throw Error(ErrorKind::InvalidArgument,
                "Entry reference must be an object with a 'uri' string");
  }
  EntryRef ref;
  ref.uri = value.at("uri").as_string();
  const auto &grant = value.get("documentTopTreeUri");
  if (grant.is_string()) {
    ref.root_grant = grant.as_string();
  }
  return ref;
}

EntryRef EntryRef::from_string(const std::string &text) {
  try {
    return from_json(json::parse(text));
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(ErrorKind::InvalidArgument,
                std::string("Malformed entry reference: ") + e.what());
  }
}

std::optional<fs::path> EntryRef::as_path() const {
  if (!is_file_uri()) {
    return std::nullopt;
  }
  return fs::path(uri.substr(std::string(FILE_SCHEME).size()));
}

bool EntryRef::is_file_uri() const { return starts_with(uri, FILE_SCHEME); }

json::Value EntryRef::to_json() const {
  json::Value v = json::Value::object();
  v["uri"] = json::Value(uri);
  v["documentTopTreeUri"] =
      root_grant ? json::Value(*root_grant) : json::Value();
  return v;
}

std::string EntryRef::to_string() const { return json::dump(to_json()); }

const char *entry_kind_name(EntryKind kind) {
  return kind == EntryKind::File ? "file" : "directory";
}

Entry Entry::from_json(const json::Value &value) {
  if (!value.is_object() || !value.get("name").is_string()) {
    throw Error(ErrorKind::InvalidArgument,
                "Entry must be an object with a 'name' string");
  }
  Entry entry;
  entry.ref = EntryRef::from_json(value.get("uri"));
  entry.name = value.at("name").as_string();
  if (value.get("mimeType").is_string()) {
    entry.kind = EntryKind::File;
    entry.mime_type = value.at("mimeType").as_string();
    if (value.get("len").is_number())
      entry.len = static_cast<uint64_t>(value.at("len").as_int());
  } else {
    entry.kind = EntryKind::Dir;
  }
  if (value.get("lastModified").is_number())
    entry.last_modified_ms = value.at("lastModified").as_int();
  return entry;
}

const char *access_mode_string(AccessMode mode) {
  switch (mode) {
  case AccessMode::Read:
    return "r";
  case AccessMode::Write:
    return "w";
  case AccessMode::WriteTruncate:
    return "wt";
  case AccessMode::WriteAppend:
    return "wa";
  case AccessMode::ReadWrite:
    return "rw";
  case AccessMode::ReadWriteTruncate:
    return "rwt";
  }
  return "r";
}

AccessMode access_mode_from_string(const std::string &mode) {
  if (mode == "r")
    return AccessMode::Read;
  if (mode == "w")
    return AccessMode::Write;
  if (mode == "wt")
    return AccessMode::WriteTruncate;
  if (mode == "wa")
    return AccessMode::WriteAppend;
  if (mode == "rw")
    return AccessMode::ReadWrite;
  if (mode == "rwt")
    return AccessMode::ReadWriteTruncate;
  throw Error(ErrorKind::InvalidArgument, "Illegal mode: " + mode);
}

bool is_truncating(AccessMode mode) {
  return mode == AccessMode::WriteTruncate ||
         mode == AccessMode::ReadWriteTruncate;
}

} // namespace safio
