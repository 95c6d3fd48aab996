#ifndef S3FS_SRC_STORE_STORE_MANAGER_HPP_
#define S3FS_SRC_STORE_STORE_MANAGER_HPP_

#include <memory>
#include "config/config_types.hpp"
#include "store/i_object_store.hpp"

namespace Aws
{
struct SDKOptions;
}  // namespace Aws

namespace S3Fs::Store
{

// Owns the SDK lifetime and the configured object store instance
class StoreManager
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit StoreManager(const Config::StoreDefinition& definition);
    ~StoreManager();

    StoreManager(const StoreManager&)            = delete;
    StoreManager& operator=(const StoreManager&) = delete;
    StoreManager(StoreManager&&)                 = delete;
    StoreManager& operator=(StoreManager&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Shared so file systems built on it may outlive a single scope; valid until Shutdown().
    std::shared_ptr<IObjectStore> GetStore() const;

    // Initialization and Shutdown
    StoreResult<void> Initialize();
    StoreResult<void> Shutdown();

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Config::StoreDefinition definition_;
    std::unique_ptr<Aws::SDKOptions> sdk_options_;
    std::shared_ptr<IObjectStore> store_instance_;
};

}  // namespace S3Fs::Store

#endif  // S3FS_SRC_STORE_STORE_MANAGER_HPP_
