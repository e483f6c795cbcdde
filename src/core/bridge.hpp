// core/bridge.hpp - Request/response channel to the platform component
#pragma once

#include "json.hpp"
#include <string>

namespace safio {

// Named, schema'd requests to the platform side. Implementations throw
// Error(BridgeInvocationFailed) with the platform's message on failure.
// Latency is unbounded; callers route invocations through a Runner.
class Bridge {
public:
  virtual ~Bridge() = default;
  virtual json::Value invoke(const std::string &command,
                             const json::Value &payload) = 0;
};

namespace bridge_cmd {
constexpr const char *GET_CONSTS = "getConsts";
constexpr const char *GET_PRIVATE_DIRS = "getPrivateBaseDirAbsolutePaths";
constexpr const char *GET_FILE_DESCRIPTOR = "getFileDescriptor";
constexpr const char *COPY_FILE = "copyFile";
constexpr const char *READ_DIR = "readDir";
constexpr const char *GET_MIME_TYPE = "getMimeType";
constexpr const char *GET_NAME = "getName";
constexpr const char *GET_LEN = "getLen";
constexpr const char *GET_METADATA = "getMetadata";
constexpr const char *CREATE_FILE = "createFile";
constexpr const char *CREATE_DIR_ALL = "createDirAll";
constexpr const char *RENAME = "rename";
constexpr const char *DELETE_FILE = "deleteFile";
constexpr const char *DELETE_EMPTY_DIR = "deleteEmptyDir";
constexpr const char *DELETE_DIR_ALL = "deleteDirAll";
} // namespace bridge_cmd

} // namespace safio
