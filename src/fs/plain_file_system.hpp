#ifndef S3FS_SRC_FS_PLAIN_FILE_SYSTEM_HPP_
#define S3FS_SRC_FS_PLAIN_FILE_SYSTEM_HPP_

#include "fs/i_file_system.hpp"
#include "store/i_object_store.hpp"

#include <memory>

namespace S3Fs::Fs
{

// Serves whole objects. Holds no per-open state and may be shared by concurrent callers.
class PlainFileSystem : public IFileSystem
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit PlainFileSystem(std::shared_ptr<Store::IObjectStore> store);
    ~PlainFileSystem() override = default;

    PlainFileSystem(const PlainFileSystem&)            = delete;
    PlainFileSystem& operator=(const PlainFileSystem&) = delete;
    PlainFileSystem(PlainFileSystem&&)                 = delete;
    PlainFileSystem& operator=(PlainFileSystem&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // IFileSystem Implementation
    FileResult<std::unique_ptr<IFile>> Open(std::string_view name) override;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::shared_ptr<Store::IObjectStore> store_;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_PLAIN_FILE_SYSTEM_HPP_
