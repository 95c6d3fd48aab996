#ifndef S3FS_SRC_FS_FILE_ERROR_HPP_
#define S3FS_SRC_FS_FILE_ERROR_HPP_

#include "store/store_error.hpp"

#include <cerrno>
#include <cstddef>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace S3Fs::Fs
{

//------------------------------------------------------------------------------//
// Error Codes declared for File Handle Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class FileErrc {
    Success = 0,    // Not an error
    EndOfFile,      // Stream ended before any byte was read
    UnexpectedEof,  // Stream ended after a partial read
    FileClosed,     // Operation on a handle that was already closed
};
// clang-format on

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class FileErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "S3Fs::Fs"; }
    std::string message(int ev) const override
    {
        switch (static_cast<FileErrc>(ev)) {
            case FileErrc::Success:
                return "Success";
            case FileErrc::EndOfFile:
                return "End of file";
            case FileErrc::UnexpectedEof:
                return "Unexpected end of file";
            case FileErrc::FileClosed:
                return "File already closed";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

inline const detail::FileErrorCategory file_error_category;

inline std::error_code make_error_code(FileErrc e) { return {static_cast<int>(e), file_error_category}; }

//------------------------------------------------------------------------------//
// Result Types
//------------------------------------------------------------------------------//
template <typename T>
using FileResult = std::expected<T, std::error_code>;

// Outcome of a full-buffer read. bytes_read is meaningful even when error is set.
struct ReadResult {
    std::size_t bytes_read = 0;
    std::error_code error;

    explicit operator bool() const noexcept { return !error; }
};

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

// Store "no such key" becomes the standard not-found condition, everything else passes through.
inline std::error_code MapStoreError(const std::error_code& ec)
{
    if (ec == Store::StoreErrc::NoSuchKey) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return ec;
}

inline bool IsNotFound(const std::error_code& ec)
{
    return ec == std::errc::no_such_file_or_directory;
}

inline int ErrorToErrno(const std::error_code& ec)
{
    if (!ec) {
        return 0;
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return ec.value();
    }
    if (ec.category() == file_error_category) {
        switch (static_cast<FileErrc>(ec.value())) {
            case FileErrc::Success:
                return 0;
            case FileErrc::EndOfFile:
            case FileErrc::UnexpectedEof:
                return EIO;
            case FileErrc::FileClosed:
                return EBADF;
            default:
                return EIO;
        }
    }
    if (ec.category() == Store::store_error_category) {
        switch (static_cast<Store::StoreErrc>(ec.value())) {
            case Store::StoreErrc::Success:
                return 0;
            case Store::StoreErrc::NoSuchKey:
            case Store::StoreErrc::NoSuchBucket:
                return ENOENT;
            case Store::StoreErrc::AccessDenied:
                return EACCES;
            case Store::StoreErrc::InvalidRange:
                return EINVAL;
            case Store::StoreErrc::NetworkFailure:
                return EHOSTUNREACH;
            case Store::StoreErrc::NotInitialized:
                return ENODEV;
            case Store::StoreErrc::StreamError:
            case Store::StoreErrc::RequestFailed:
            default:
                return EIO;
        }
    }
    return EIO;
}

}  // namespace S3Fs::Fs

namespace std
{
template <>
struct is_error_code_enum<S3Fs::Fs::FileErrc> : true_type {
};
}  // namespace std

#endif  // S3FS_SRC_FS_FILE_ERROR_HPP_
