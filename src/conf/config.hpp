// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace safio {

struct Config {
  bool verbose = false;
  fs::path log_file;
  // API level reported by the host bridge
  int api_level = DEFAULT_HOST_API_LEVEL;
  // Overrides the bridge's no-backup data directory as scratch parent
  fs::path scratch_base_dir;
  unsigned async_workers = DEFAULT_ASYNC_WORKERS;
  bool emulate_host = false;
  std::vector<std::string> indirect_write_prefixes;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(bool verbose_override, bool emulate_override,
                      const fs::path &log_file_override);
};

} // namespace safio
