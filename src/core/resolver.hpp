// core/resolver.hpp - Child reference resolution
#pragma once

#include "bridge.hpp"
#include "entry.hpp"
#include "runner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace safio {

// Splits a relative path into its non-empty segments. Throws
// InvalidRelativePath on ".", ".." or a leading '/'.
std::vector<std::string> split_relative_path(const std::string &relative_path);

// True for content:// references of a provider whose document ids are
// hierarchical paths, which can be extended without asking the provider
bool is_hierarchical_document(const EntryRef &ref);

class PathResolver {
public:
  PathResolver(Bridge &bridge, Runner &runner)
      : bridge_(bridge), runner_(runner) {}

  // Child of base at relative_path. With expected set, one extra type query
  // confirms the entry exists with that kind.
  EntryRef resolve(const EntryRef &base, const std::string &relative_path,
                   std::optional<EntryKind> expected = std::nullopt);

  EntryRef resolve_file(const EntryRef &base,
                        const std::string &relative_path) {
    return resolve(base, relative_path, EntryKind::File);
  }
  EntryRef resolve_dir(const EntryRef &base, const std::string &relative_path) {
    return resolve(base, relative_path, EntryKind::Dir);
  }
  EntryRef resolve_unchecked(const EntryRef &base,
                             const std::string &relative_path) {
    return resolve(base, relative_path);
  }

  EntryKind entry_kind(const EntryRef &ref);

private:
  EntryRef walk_segments(const EntryRef &base,
                         const std::vector<std::string> &segments);

  Bridge &bridge_;
  Runner &runner_;
};

} // namespace safio
