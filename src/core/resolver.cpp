// core/resolver.cpp - Child reference resolution implementation
#include "resolver.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "error.hpp"
#include <algorithm>

namespace safio {

std::vector<std::string>
split_relative_path(const std::string &relative_path) {
  if (!relative_path.empty() && relative_path[0] == '/') {
    throw Error(ErrorKind::InvalidRelativePath,
                "Relative path must not be absolute: " + relative_path);
  }

  std::vector<std::string> segments;
  for (const auto &segment : split(relative_path, '/')) {
    if (segment.empty())
      continue;
    if (segment == "." || segment == "..") {
      throw Error(ErrorKind::InvalidRelativePath,
                  "Relative path must not contain '" + segment +
                      "': " + relative_path);
    }
    segments.push_back(segment);
  }
  return segments;
}

bool is_hierarchical_document(const EntryRef &ref) {
  if (!starts_with(ref.uri, CONTENT_SCHEME))
    return false;

  std::string rest = ref.uri.substr(std::string(CONTENT_SCHEME).size());
  auto slash = rest.find('/');
  if (slash == std::string::npos)
    return false;

  std::string authority = rest.substr(0, slash);
  if (std::find(HIERARCHICAL_AUTHORITIES.begin(),
                HIERARCHICAL_AUTHORITIES.end(),
                authority) == HIERARCHICAL_AUTHORITIES.end()) {
    return false;
  }

  // content://<authority>/document/<id> or
  // content://<authority>/tree/<tree-id>/document/<id>
  std::string path = rest.substr(slash);
  if (starts_with(path, "/document/"))
    return path.size() > std::string("/document/").size();
  if (starts_with(path, "/tree/")) {
    auto doc = path.find("/document/", 6);
    return doc != std::string::npos &&
           doc + std::string("/document/").size() < path.size();
  }
  return false;
}

EntryRef PathResolver::resolve(const EntryRef &base,
                               const std::string &relative_path,
                               std::optional<EntryKind> expected) {
  auto segments = split_relative_path(relative_path);

  EntryRef child = base;
  if (segments.empty()) {
    // base itself
  } else if (base.is_file_uri()) {
    std::string joined = base.uri;
    while (joined.size() > std::string(FILE_SCHEME).size() + 1 &&
           joined.back() == '/') {
      joined.pop_back();
    }
    for (const auto &segment : segments) {
      if (joined.back() != '/')
        joined += '/';
      joined += segment;
    }
    child.uri = joined;
  } else if (is_hierarchical_document(base)) {
    std::string rel;
    for (const auto &segment : segments) {
      if (!rel.empty())
        rel += '/';
      rel += segment;
    }
    child.uri = base.uri + ENCODED_SEPARATOR + encode_uri_component(rel);
  } else {
    child = walk_segments(base, segments);
  }

  if (expected) {
    EntryKind actual = entry_kind(child);
    if (actual != *expected) {
      throw Error(ErrorKind::TypeMismatch,
                  "This is not a " + std::string(entry_kind_name(*expected)) +
                      ": " + child.uri);
    }
  }
  return child;
}

EntryKind PathResolver::entry_kind(const EntryRef &ref) {
  json::Value payload = json::Value::object();
  payload["uri"] = ref.to_json();
  json::Value res = runner_.run(
      [&] { return bridge_.invoke(bridge_cmd::GET_MIME_TYPE, payload); });
  return res.get("value").is_string() ? EntryKind::File : EntryKind::Dir;
}

EntryRef PathResolver::walk_segments(const EntryRef &base,
                                     const std::vector<std::string> &segments) {
  EntryRef current = base;
  for (const auto &segment : segments) {
    json::Value payload = json::Value::object();
    payload["uri"] = current.to_json();
    json::Value res = runner_.run(
        [&] { return bridge_.invoke(bridge_cmd::READ_DIR, payload); });

    bool found = false;
    const json::Value &entries = res.get("entries");
    if (entries.is_array()) {
      for (const auto &entry : entries.as_array()) {
        if (entry.get("name").is_string() &&
            entry.get("name").as_string() == segment) {
          EntryRef next = EntryRef::from_json(entry.get("uri"));
          if (!next.root_grant)
            next.root_grant = base.root_grant;
          current = next;
          found = true;
          break;
        }
      }
    }
    if (!found) {
      throw Error(ErrorKind::NotFound,
                  "No entry named '" + segment + "' in " + current.uri);
    }
  }
  return current;
}

} // namespace safio
