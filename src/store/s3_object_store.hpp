#ifndef S3FS_SRC_STORE_S3_OBJECT_STORE_HPP_
#define S3FS_SRC_STORE_S3_OBJECT_STORE_HPP_

#include "config/config_types.hpp"
#include "store/i_object_store.hpp"

#include <memory>
#include <string>

namespace Aws::S3
{
class S3Client;
}  // namespace Aws::S3

namespace S3Fs::Store
{

// Object store backed by one S3 bucket. The AWS SDK must be initialized for the whole
// lifetime of an instance (see StoreManager).
class S3ObjectStore : public IObjectStore
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit S3ObjectStore(const Config::StoreDefinition& definition);
    ~S3ObjectStore() override;

    S3ObjectStore(const S3ObjectStore&)            = delete;
    S3ObjectStore& operator=(const S3ObjectStore&) = delete;
    S3ObjectStore(S3ObjectStore&&)                 = delete;
    S3ObjectStore& operator=(S3ObjectStore&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // IObjectStore Implementation
    [[nodiscard]] const std::string& GetBucket() const override;
    StoreResult<ObjectResponse> GetObject(
        const std::string& key, const std::optional<ByteRange>& range
    ) override;
    StoreResult<ObjectMetadata> HeadObject(const std::string& key) override;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::StoreDefinition definition_;
    std::unique_ptr<Aws::S3::S3Client> client_;
};

}  // namespace S3Fs::Store

#endif  // S3FS_SRC_STORE_S3_OBJECT_STORE_HPP_
