#ifndef S3FS_SRC_CONFIG_CONFIG_TYPES_HPP_
#define S3FS_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <optional>
#include <string>

namespace S3Fs::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class StoreType : std::uint8_t { S3 };

std::optional<StoreType> StringToStoreType(const std::string &type_str);
const char *StoreTypeToString(StoreType type);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
};

struct StoreDefinition {
    StoreType type = StoreType::S3;
    std::string bucket;
    std::string region = std::string(Constants::DEFAULT_REGION);
    std::optional<std::string> endpoint;  ///< Overrides the regional endpoint (e.g. MinIO)
    bool path_style = false;              ///< Path-style instead of virtual-host addressing

    bool IsValid() const;
};

struct RangeDefinition {
    std::int64_t start = 0;
    std::int64_t end   = 0;

    bool IsValid() const { return start >= 0 && start <= end; }
};

struct AppConfig {
    StoreDefinition store_definition;
    std::optional<RangeDefinition> range;  ///< Present selects the ranged file system
    GlobalSettings global_settings;

    bool IsValid() const;
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<StoreType> StringToStoreType(const std::string &type_str)
{
    if (type_str == "s3") {
        return StoreType::S3;
    }
    return std::nullopt;
}

inline const char *StoreTypeToString(StoreType type)
{
    switch (type) {
        case StoreType::S3:
            return "S3";
        default:
            return "Unknown";
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool StoreDefinition::IsValid() const
{
    if (bucket.empty()) {
        return false;
    }
    if (region.empty() && !endpoint.has_value()) {
        spdlog::error("Store definition needs a region or an endpoint.");
        return false;
    }
    if (endpoint.has_value() && endpoint->empty()) {
        return false;
    }
    return true;
}

inline bool AppConfig::IsValid() const
{
    if (!store_definition.IsValid()) {
        return false;
    }
    if (range.has_value() && !range->IsValid()) {
        return false;
    }
    return true;
}

}  // namespace S3Fs::Config

#endif  // S3FS_SRC_CONFIG_CONFIG_TYPES_HPP_
