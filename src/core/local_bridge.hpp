// core/local_bridge.hpp - Host bridge serving file:// references
#pragma once

#include "../conf/config.hpp"
#include "bridge.hpp"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace safio {

struct LocalBridgeOptions {
  int api_level = DEFAULT_HOST_API_LEVEL;
  fs::path data_dir;
  fs::path cache_dir;
  fs::path no_backup_dir;
};

// Answers bridge requests for plain file:// references straight from the
// local filesystem. content:// references are rejected. "w" follows the
// platform rule for the configured API level: it truncates up to Android 9
// and leaves existing bytes in place afterwards.
class LocalBridge : public Bridge {
public:
  explicit LocalBridge(LocalBridgeOptions options);

  json::Value invoke(const std::string &command,
                     const json::Value &payload) override;

private:
  json::Value dispatch(const std::string &command,
                       const json::Value &payload) const;
  json::Value get_consts() const;
  json::Value get_private_dirs() const;
  json::Value open_descriptor(const json::Value &payload) const;
  json::Value copy_file(const json::Value &payload) const;
  json::Value read_dir(const json::Value &payload) const;
  json::Value get_mime_type(const json::Value &payload) const;
  json::Value get_name(const json::Value &payload) const;
  json::Value get_len(const json::Value &payload) const;
  json::Value get_metadata(const json::Value &payload) const;
  json::Value create_file(const json::Value &payload) const;
  json::Value create_dir_all(const json::Value &payload) const;
  json::Value rename(const json::Value &payload) const;
  json::Value delete_file(const json::Value &payload) const;
  json::Value delete_empty_dir(const json::Value &payload) const;
  json::Value delete_dir_all(const json::Value &payload) const;

  LocalBridgeOptions options_;
};

// Bridge for the current host. Throws UnsupportedPlatform off Android
// unless host emulation is enabled in the config.
std::unique_ptr<Bridge> open_host_bridge(const Config &config);

} // namespace safio
