#ifndef S3FS_SRC_STORE_I_OBJECT_STORE_HPP_
#define S3FS_SRC_STORE_I_OBJECT_STORE_HPP_

#include "store/byte_range.hpp"
#include "store/store_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace S3Fs::Store
{

struct ObjectMetadata {
    std::int64_t content_length = 0;
    std::chrono::system_clock::time_point last_modified{};
};

// Sequential, single-pass response body. Not seekable, not thread-safe.
class IObjectBody
{
    public:
    virtual ~IObjectBody() = default;

    // Returns the number of bytes copied into buffer, 0 once the body is exhausted.
    virtual StoreResult<std::size_t> Read(std::span<std::byte> buffer) = 0;
    virtual StoreResult<void> Close()                                 = 0;
};

struct ObjectResponse {
    ObjectMetadata metadata;
    std::unique_ptr<IObjectBody> body;
};

// Interface for a remote object store addressed by key within one bucket
class IObjectStore
{
    public:
    virtual ~IObjectStore() = default;

    [[nodiscard]] virtual const std::string& GetBucket() const = 0;

    // A present range asks for the inclusive byte slice only; metadata.content_length then
    // describes the returned slice, not the whole object.
    virtual StoreResult<ObjectResponse> GetObject(
        const std::string& key, const std::optional<ByteRange>& range
    ) = 0;

    virtual StoreResult<ObjectMetadata> HeadObject(const std::string& key) = 0;
};

}  // namespace S3Fs::Store

#endif  // S3FS_SRC_STORE_I_OBJECT_STORE_HPP_
