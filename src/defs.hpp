// Constants and definitions
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace safio {

// Directories
constexpr const char *BASE_DIR = "/data/local/tmp/safio/";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DEFAULT_LOG_FILE = "/data/local/tmp/safio/safio.log";

// Scratch storage, relative to the no-backup private data directory
constexpr const char *SCRATCH_DIR_NAME = "safio-scratch-01K486FKQ2BZSBGFD34RFH9FWJ";

// URI schemes
constexpr const char *FILE_SCHEME = "file://";
constexpr const char *CONTENT_SCHEME = "content://";

// Percent-encoded forms used when building child document ids
constexpr const char *ENCODED_SEPARATOR = "%2F";

// Provider authorities whose document ids are "<volume>:<path>" and can be
// extended by appending an encoded relative path
const std::vector<std::string> HIERARCHICAL_AUTHORITIES = {
    "com.android.externalstorage.documents",
};

// Providers that accept raw descriptors but drop the written data
const std::vector<std::string> INDIRECT_WRITE_PREFIXES = {
    "content://com.google.android.apps.docs", // Google Drive
};

// Android API levels
constexpr int32_t API_LEVEL_ANDROID_9 = 28;
constexpr int32_t API_LEVEL_ANDROID_10 = 29;
constexpr int32_t DEFAULT_HOST_API_LEVEL = 35;

// Worker pool
constexpr unsigned DEFAULT_ASYNC_WORKERS = 2;

} // namespace safio
