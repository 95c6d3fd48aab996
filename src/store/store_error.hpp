#ifndef S3FS_SRC_STORE_STORE_ERROR_HPP_
#define S3FS_SRC_STORE_STORE_ERROR_HPP_

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace S3Fs::Store
{

//------------------------------------------------------------------------------//
// Error Codes reported by Object Store backends
//------------------------------------------------------------------------------//

// clang-format off
enum class StoreErrc {
    Success = 0,     // Not an error
    NoSuchKey,       // Object key does not exist in the bucket
    NoSuchBucket,    // Bucket does not exist
    AccessDenied,    // Credentials missing, invalid or not authorized
    InvalidRange,    // Requested byte range cannot be satisfied
    NetworkFailure,  // Transport-level failure talking to the store
    StreamError,     // Response body could not be read
    RequestFailed,   // Store rejected the request for another reason
    NotInitialized,  // Store used before initialization or after shutdown
};
// clang-format on

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StoreErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "S3Fs::Store"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::Success:
                return "Success";
            case StoreErrc::NoSuchKey:
                return "The specified key does not exist";
            case StoreErrc::NoSuchBucket:
                return "The specified bucket does not exist";
            case StoreErrc::AccessDenied:
                return "Access denied";
            case StoreErrc::InvalidRange:
                return "The requested range is not satisfiable";
            case StoreErrc::NetworkFailure:
                return "Network failure while contacting the object store";
            case StoreErrc::StreamError:
                return "Error reading object body";
            case StoreErrc::RequestFailed:
                return "Object store request failed";
            case StoreErrc::NotInitialized:
                return "Object store is not initialized";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StoreErrorCategory store_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StoreErrc e)
{
    return {static_cast<int>(e), store_error_category};
}

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StoreResult = std::expected<T, std::error_code>;

}  // namespace S3Fs::Store

// Enable std::error_code implicit conversion for StoreErrc
namespace std
{
template <>
struct is_error_code_enum<S3Fs::Store::StoreErrc> : true_type {
};
}  // namespace std

#endif  // S3FS_SRC_STORE_STORE_ERROR_HPP_
