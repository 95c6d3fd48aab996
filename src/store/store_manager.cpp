#include "store/store_manager.hpp"
#include "store/s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace S3Fs::Store
{

StoreManager::StoreManager(const Config::StoreDefinition& definition) : definition_(definition)
{
    if (!definition_.IsValid()) {
        throw std::invalid_argument("StoreManager requires a valid store definition.");
    }
}

StoreManager::~StoreManager()
{
    if (sdk_options_) {
        auto res = Shutdown();
        if (!res) {
            spdlog::error("~StoreManager: shutdown failed: {}", res.error().message());
        }
    }
}

std::shared_ptr<IObjectStore> StoreManager::GetStore() const { return store_instance_; }

StoreResult<void> StoreManager::Initialize()
{
    if (sdk_options_) {
        spdlog::debug("StoreManager already initialized.");
        return {};
    }

    sdk_options_ = std::make_unique<Aws::SDKOptions>();
    Aws::InitAPI(*sdk_options_);

    // Instantiate the correct store type based on config
    try {
        switch (definition_.type) {
            case Config::StoreType::S3:
                store_instance_ = std::make_shared<S3ObjectStore>(definition_);
                spdlog::info(
                    "StoreManager created S3ObjectStore for bucket '{}' (region '{}')",
                    definition_.bucket, definition_.region
                );
                break;
            default:
                spdlog::error("StoreManager: unsupported store type configured.");
                Aws::ShutdownAPI(*sdk_options_);
                sdk_options_.reset();
                return std::unexpected(make_error_code(StoreErrc::NotInitialized));
        }
    } catch (const std::exception& e) {
        spdlog::error("StoreManager: failed to create object store: {}", e.what());
        Aws::ShutdownAPI(*sdk_options_);
        sdk_options_.reset();
        return std::unexpected(make_error_code(StoreErrc::NotInitialized));
    }
    return {};
}

StoreResult<void> StoreManager::Shutdown()
{
    if (!sdk_options_) {
        return std::unexpected(make_error_code(StoreErrc::NotInitialized));
    }

    if (store_instance_ && store_instance_.use_count() > 1) {
        spdlog::warn(
            "StoreManager shutting down while {} other owners still hold the store",
            store_instance_.use_count() - 1
        );
    }
    store_instance_.reset();

    spdlog::debug("StoreManager shutting down AWS SDK");
    Aws::ShutdownAPI(*sdk_options_);
    sdk_options_.reset();
    return {};
}

}  // namespace S3Fs::Store
