#ifndef S3FS_SRC_STORE_BYTE_RANGE_HPP_
#define S3FS_SRC_STORE_BYTE_RANGE_HPP_

#include "store/store_error.hpp"

#include <cstdint>
#include <string>

namespace S3Fs::Store
{

// Inclusive [start, end] byte offsets into an object. Always satisfies 0 <= start <= end.
class ByteRange
{
    public:
    static StoreResult<ByteRange> Create(std::int64_t start, std::int64_t end)
    {
        if (start < 0 || end < start) {
            return std::unexpected(make_error_code(StoreErrc::InvalidRange));
        }
        return ByteRange(start, end);
    }

    std::int64_t Start() const noexcept { return start_; }
    std::int64_t End() const noexcept { return end_; }
    // Up to 2^63, for [0, INT64_MAX]
    std::uint64_t Length() const noexcept
    {
        return static_cast<std::uint64_t>(end_ - start_) + 1;
    }

    // Value for an HTTP Range header, e.g. "bytes=0-1023"
    std::string ToHeader() const
    {
        return "bytes=" + std::to_string(start_) + "-" + std::to_string(end_);
    }

    bool operator==(const ByteRange&) const = default;

    private:
    ByteRange(std::int64_t start, std::int64_t end) noexcept : start_(start), end_(end) {}

    std::int64_t start_;
    std::int64_t end_;
};

}  // namespace S3Fs::Store

#endif  // S3FS_SRC_STORE_BYTE_RANGE_HPP_
