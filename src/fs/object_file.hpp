#ifndef S3FS_SRC_FS_OBJECT_FILE_HPP_
#define S3FS_SRC_FS_OBJECT_FILE_HPP_

#include "fs/i_file.hpp"
#include "store/i_object_store.hpp"

#include <memory>

namespace S3Fs::Fs
{

// File handle over one object response body. Single reader, not thread-safe.
class ObjectFile : public IFile
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    ObjectFile(FileStat stat, std::unique_ptr<Store::IObjectBody> body);
    ~ObjectFile() override;

    ObjectFile(const ObjectFile&)            = delete;
    ObjectFile& operator=(const ObjectFile&) = delete;
    ObjectFile(ObjectFile&&)                 = delete;
    ObjectFile& operator=(ObjectFile&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // IFile Implementation
    ReadResult Read(std::span<std::byte> buffer) override;

    // Seeking would need the whole object buffered locally. Always reports position 0 and
    // leaves the stream untouched; open a ranged file system for a different slice instead.
    FileResult<std::int64_t> Seek(std::int64_t offset, SeekOrigin origin) override;

    [[nodiscard]] const FileStat& Stat() const override;

    // Objects are never directories.
    FileResult<std::vector<FileStat>> Readdir(int count) override;

    FileResult<void> Close() override;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const FileStat stat_;
    std::unique_ptr<Store::IObjectBody> body_;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_OBJECT_FILE_HPP_
