#ifndef S3FS_SRC_CONFIG_CONFIG_LOADER_HPP_
#define S3FS_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace S3Fs::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<AppConfig, LoadError>;
using LoadErrorMsg = std::expected<AppConfig, std::string>;

LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

// Parses "START-END" (inclusive byte offsets). Returns std::nullopt if malformed or invalid.
std::optional<RangeDefinition> ParseRangeString(const std::string &range_str);

}  // namespace S3Fs::Config

#endif  // S3FS_SRC_CONFIG_CONFIG_LOADER_HPP_
