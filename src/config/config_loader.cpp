#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace S3Fs::Config
{

namespace
{

std::optional<std::int64_t> ParseOffset(std::string_view str)
{
    if (str.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    auto conv_res      = std::from_chars(str.data(), str.data() + str.size(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

std::optional<RangeDefinition> ParseRangeString(const std::string &range_str)
{
    auto dash = range_str.find('-');
    if (dash == std::string::npos) {
        spdlog::warn("Range '{}' is missing the '-' separator", range_str);
        return std::nullopt;
    }

    auto start = ParseOffset(std::string_view(range_str).substr(0, dash));
    auto end   = ParseOffset(std::string_view(range_str).substr(dash + 1));
    if (!start || !end) {
        spdlog::warn("Failed to parse offsets of range '{}'", range_str);
        return std::nullopt;
    }

    RangeDefinition range{*start, *end};
    if (!range.IsValid()) {
        spdlog::warn("Range '{}' must satisfy 0 <= start <= end", range_str);
        return std::nullopt;
    }
    return range;
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    AppConfig config;

    if (!j.contains("store") || !j.at("store").is_object()) {
        spdlog::error("'store' object is missing or not an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    const auto &store_json = j.at("store");
    {
        std::string store_type_str;
        TRY_ASSIGN_REQUIRED(store_type_str, store_json, "type", std::string);

        auto store_type_opt = StringToStoreType(store_type_str);
        if (!store_type_opt) {
            spdlog::error("Invalid 'type' value in store definition: {}", store_type_str);
            return std::unexpected(LoadError::ValidationError);
        }
        config.store_definition.type = *store_type_opt;

        TRY_ASSIGN_REQUIRED(config.store_definition.bucket, store_json, "bucket", std::string);
        TRY_ASSIGN(config.store_definition.region, store_json, "region", std::string);
        TRY_ASSIGN(config.store_definition.path_style, store_json, "path_style", bool);

        if (store_json.contains("endpoint")) {
            std::string endpoint_str;
            TRY_ASSIGN(endpoint_str, store_json, "endpoint", std::string);
            config.store_definition.endpoint = endpoint_str;
        }
    }

    if (!config.store_definition.IsValid()) {
        spdlog::error("Parsed store definition is invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Parsed store: type='{}', bucket='{}', region='{}', endpoint='{}'",
        StoreTypeToString(config.store_definition.type), config.store_definition.bucket,
        config.store_definition.region, config.store_definition.endpoint.value_or("<default>")
    );

    if (j.contains("range")) {
        const auto &range_json = j.at("range");
        if (!range_json.is_object()) {
            spdlog::error("'range' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        RangeDefinition range;
        TRY_ASSIGN_REQUIRED(range.start, range_json, "start", std::int64_t);
        TRY_ASSIGN_REQUIRED(range.end, range_json, "end", std::int64_t);
        if (!range.IsValid()) {
            spdlog::error(
                "Invalid 'range' [{}, {}]: must satisfy 0 <= start <= end", range.start, range.end
            );
            return std::unexpected(LoadError::ValidationError);
        }
        config.range = range;
        spdlog::info("Parsed range: bytes={}-{}", range.start, range.end);
    }

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str =
            spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data();
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);  // Assign default first
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
                // Keep the default already set in config.global_settings
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
    }
    spdlog::info(
        "Global settings: log_level='{}'",
        spdlog::level::to_string_view(config.global_settings.log_level)
    );

    if (!config.IsValid()) {
        spdlog::error("Overall configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }

    spdlog::info("Configuration loaded successfully for bucket: {}", config.store_definition.bucket);
    return config;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    } else {
        std::string error_message = "Failed to load config (" + file_path.string() + "): ";
        switch (result.error()) {
            case LoadError::FileNotFound:
                error_message += "File not found.";
                break;
            case LoadError::JsonParseError:
                error_message += "JSON parsing failed.";
                break;
            case LoadError::ValidationError:
                error_message += "Configuration validation failed.";
                break;
            default:
                error_message += "Unknown error.";
                break;
        }
        return std::unexpected(error_message);
    }
}

}  // namespace S3Fs::Config
