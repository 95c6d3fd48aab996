#ifndef S3FS_SRC_FS_I_FILE_HPP_
#define S3FS_SRC_FS_I_FILE_HPP_

#include "fs/file_error.hpp"
#include "fs/file_stat.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace S3Fs::Fs
{

enum class SeekOrigin { Begin, Current, End };

// File contract consumed by static file serving callers
class IFile
{
    public:
    virtual ~IFile() = default;

    // Fills the whole buffer, reporting a short count together with an error otherwise.
    virtual ReadResult Read(std::span<std::byte> buffer) = 0;

    virtual FileResult<std::int64_t> Seek(std::int64_t offset, SeekOrigin origin) = 0;

    [[nodiscard]] virtual const FileStat& Stat() const = 0;

    virtual FileResult<std::vector<FileStat>> Readdir(int count) = 0;

    virtual FileResult<void> Close() = 0;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_I_FILE_HPP_
