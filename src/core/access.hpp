// core/access.hpp - Open mode negotiation and truncation guarantee
#pragma once

#include "bridge.hpp"
#include "entry.hpp"
#include "file_handle.hpp"
#include "runner.hpp"
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace safio {

class AccessNegotiator {
public:
  AccessNegotiator(Bridge &bridge, Runner &runner)
      : bridge_(bridge), runner_(runner) {}

  // Platform API level, queried once and cached
  int api_level();

  FileHandle open(const EntryRef &ref, AccessMode mode);

  // Tries each mode in order and returns the first that opens. Failed
  // attempts are logged; ModeExhaustedError lists them all when none works.
  std::pair<FileHandle, AccessMode>
  open_with_fallback(const EntryRef &ref, const std::vector<AccessMode> &modes);

  // Handle positioned on an empty file, whatever the provider supports
  FileHandle open_writable(const EntryRef &ref);
  FileHandle open_readable(const EntryRef &ref) {
    return open(ref, AccessMode::Read);
  }

private:
  Bridge &bridge_;
  Runner &runner_;
  std::mutex api_mutex_;
  std::optional<int> api_level_;
};

} // namespace safio
