// utils.hpp - Utility functions
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace safio {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);
  bool verbose() const { return verbose_.load(std::memory_order_relaxed); }

private:
  Logger() = default;
  // Read on every log call without the mutex
  std::atomic<bool> verbose_{false};
  std::unique_ptr<std::ofstream> log_file_;
  std::mutex mutex_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
std::string errno_string(int err);

// String utilities
bool starts_with(const std::string &s, const std::string &prefix);
std::string trim(const std::string &s);
std::vector<std::string> split(const std::string &s, char sep);

// Android Uri.encode: keeps [A-Za-z0-9_!.~'()*-], escapes everything else
std::string encode_uri_component(const std::string &input);
std::string decode_uri_component(const std::string &input);

} // namespace safio
