#ifndef S3FS_SRC_STORE_S3_UTILS_HPP_
#define S3FS_SRC_STORE_S3_UTILS_HPP_

#include "store/i_object_store.hpp"
#include "store/store_error.hpp"

#include <aws/core/utils/DateTime.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectResult.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>

namespace S3Fs::Store
{

//------------------------------------------------------------------------------//
// AWS SDK Conversions
//------------------------------------------------------------------------------//

// Typed S3 errors win; a bare 416 or 404 (HEAD responses have no error body) is
// recognized by status code.
StoreErrc S3ErrorToStoreErrc(const Aws::S3::S3Error& error);

std::chrono::system_clock::time_point ToTimePoint(const Aws::Utils::DateTime& date_time);

//------------------------------------------------------------------------------//
// Response Body
//------------------------------------------------------------------------------//

// Body of a GET response. Owns the SDK result, which owns the underlying stream.
class S3ObjectBody : public IObjectBody
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit S3ObjectBody(Aws::S3::Model::GetObjectResult&& result);
    ~S3ObjectBody() override = default;

    S3ObjectBody(const S3ObjectBody&)            = delete;
    S3ObjectBody& operator=(const S3ObjectBody&) = delete;
    S3ObjectBody(S3ObjectBody&&)                 = delete;
    S3ObjectBody& operator=(S3ObjectBody&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // IObjectBody Implementation
    StoreResult<std::size_t> Read(std::span<std::byte> buffer) override;
    StoreResult<void> Close() override;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::unique_ptr<Aws::S3::Model::GetObjectResult> result_;
};

}  // namespace S3Fs::Store

#endif  // S3FS_SRC_STORE_S3_UTILS_HPP_
