#ifndef S3FS_SRC_APP_CONSTANTS_HPP_
#define S3FS_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <cstddef>
#include <string_view>
#include <sys/stat.h>

namespace S3Fs::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "s3fs";
constexpr std::string_view APP_VERSION_STRING = "s3fs version 0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Object Store
constexpr std::string_view DEFAULT_REGION = "us-east-1";

// Files
// owner: read, write; everyone else: read
constexpr mode_t DEFAULT_FILE_MODE = 0644;
constexpr std::size_t STREAM_CHUNK_SIZE = 64 * 1024;

}  // namespace S3Fs::Constants

#endif  // S3FS_SRC_APP_CONSTANTS_HPP_
