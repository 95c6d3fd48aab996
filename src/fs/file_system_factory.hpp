#ifndef S3FS_SRC_FS_FILE_SYSTEM_FACTORY_HPP_
#define S3FS_SRC_FS_FILE_SYSTEM_FACTORY_HPP_

#include "config/config_types.hpp"
#include "fs/i_file_system.hpp"
#include "fs/plain_file_system.hpp"
#include "fs/ranged_file_system.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace S3Fs::Fs
{

class FileSystemFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    FileSystemFactory()                                    = delete;
    FileSystemFactory(const FileSystemFactory&)            = delete;
    FileSystemFactory& operator=(const FileSystemFactory&) = delete;
    FileSystemFactory(FileSystemFactory&&)                 = delete;
    FileSystemFactory& operator=(FileSystemFactory&&)      = delete;
    ~FileSystemFactory()                                   = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // A range selects RangedFileSystem, otherwise PlainFileSystem.
    static FileResult<std::unique_ptr<IFileSystem>> Create(
        std::shared_ptr<Store::IObjectStore> store,
        const std::optional<Config::RangeDefinition>& range
    )
    {
        if (!store) {
            return std::unexpected(make_error_code(Store::StoreErrc::NotInitialized));
        }
        if (!range.has_value()) {
            return std::make_unique<PlainFileSystem>(std::move(store));
        }

        auto byte_range = Store::ByteRange::Create(range->start, range->end);
        if (!byte_range) {
            return std::unexpected(byte_range.error());
        }
        return std::make_unique<RangedFileSystem>(std::move(store), *byte_range);
    }
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_FILE_SYSTEM_FACTORY_HPP_
