#ifndef S3FS_SRC_FS_I_FILE_SYSTEM_HPP_
#define S3FS_SRC_FS_I_FILE_SYSTEM_HPP_

#include "fs/i_file.hpp"

#include <memory>
#include <string_view>

namespace S3Fs::Fs
{

class IFileSystem
{
    public:
    virtual ~IFileSystem() = default;

    // Only the base name of `name` is used as the object key. A missing object reports
    // std::errc::no_such_file_or_directory; any other store error is returned unchanged.
    virtual FileResult<std::unique_ptr<IFile>> Open(std::string_view name) = 0;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_I_FILE_SYSTEM_HPP_
