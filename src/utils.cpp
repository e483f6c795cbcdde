// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cctype>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

namespace safio {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_.store(verbose, std::memory_order_relaxed);

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    auto file = std::make_unique<std::ofstream>(log_path, std::ios::app);
    if (file->is_open()) {
      log_file_ = std::move(file);
    }
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose()) {
    return;
  }

  auto now = std::time(nullptr);
  struct tm tm_buf;
  localtime_r(&now, &tm_buf);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

std::string errno_string(int err) { return std::string(strerror(err)); }

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() &&
         s.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  std::stringstream ss(s);
  std::string part;
  while (std::getline(ss, part, sep)) {
    parts.push_back(part);
  }
  return parts;
}

static bool is_uri_safe(unsigned char c) {
  if (std::isalnum(c)) {
    return true;
  }
  switch (c) {
  case '_':
  case '-':
  case '!':
  case '.':
  case '~':
  case '\'':
  case '(':
  case ')':
  case '*':
    return true;
  default:
    return false;
  }
}

std::string encode_uri_component(const std::string &input) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(input.size() * 3);
  for (unsigned char c : input) {
    if (is_uri_safe(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(HEX[c >> 4]);
      out.push_back(HEX[c & 0x0F]);
    }
  }
  return out;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string decode_uri_component(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size()) {
      int hi = hex_value(input[i + 1]);
      int lo = hex_value(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(input[i]);
  }
  return out;
}

} // namespace safio
