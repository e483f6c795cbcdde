// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace safio {

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = fs::path(BASE_DIR) / CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN("Ignoring malformed config line " + std::to_string(line_no) +
               " in " + path.string());
      continue;
    }

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    key.erase(0, key.find_first_not_of(" \t"));
    key.erase(key.find_last_not_of(" \t") + 1);
    value.erase(0, value.find_first_not_of(" \t\""));
    value.erase(value.find_last_not_of(" \t\"") + 1);

    if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "api_level") {
      try {
        config.api_level = std::stoi(value);
      } catch (const std::exception &) {
        throw std::runtime_error("Invalid api_level in config: " + value);
      }
    } else if (key == "scratch_base_dir")
      config.scratch_base_dir = value;
    else if (key == "async_workers") {
      try {
        int n = std::stoi(value);
        config.async_workers = n > 0 ? static_cast<unsigned>(n) : 1;
      } catch (const std::exception &) {
        throw std::runtime_error("Invalid async_workers in config: " + value);
      }
    } else if (key == "emulate_host")
      config.emulate_host = (value == "true");
    else if (key == "indirect_write_prefixes") {
      for (const auto &part : split(value, ',')) {
        std::string prefix = trim(part);
        if (!prefix.empty()) {
          config.indirect_write_prefixes.push_back(prefix);
        }
      }
    } else {
      LOG_DEBUG("Unknown config key: " + key);
    }
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# safio Configuration\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "api_level = " << api_level << "\n";
  if (!scratch_base_dir.empty()) {
    file << "scratch_base_dir = \"" << scratch_base_dir.string() << "\"\n";
  }
  file << "async_workers = " << async_workers << "\n";
  file << "emulate_host = " << (emulate_host ? "true" : "false") << "\n";

  if (!indirect_write_prefixes.empty()) {
    file << "indirect_write_prefixes = \"";
    for (size_t i = 0; i < indirect_write_prefixes.size(); ++i) {
      file << indirect_write_prefixes[i];
      if (i < indirect_write_prefixes.size() - 1)
        file << ",";
    }
    file << "\"\n";
  }

  return true;
}

void Config::merge_with_cli(bool verbose_override, bool emulate_override,
                            const fs::path &log_file_override) {
  if (verbose_override) {
    verbose = true;
  }
  if (emulate_override) {
    emulate_host = true;
  }
  if (!log_file_override.empty()) {
    log_file = log_file_override;
  }
}

} // namespace safio
