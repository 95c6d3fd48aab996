#ifndef S3FS_SRC_FS_RANGED_FILE_SYSTEM_HPP_
#define S3FS_SRC_FS_RANGED_FILE_SYSTEM_HPP_

#include "fs/i_file_system.hpp"
#include "store/byte_range.hpp"
#include "store/i_object_store.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace S3Fs::Fs
{

// Serves one fixed inclusive byte range of every object it opens.
//
// The range belongs to the instance, so a caller serving different ranges (one per HTTP
// request, say) needs one RangedFileSystem per range. Reusing an instance for another range
// is not detected.
//
// Stat().Size() of an opened file is the size of the whole object, looked up with a second
// HEAD request, while Read() only yields the bytes of the range. If that lookup fails the
// open still succeeds and the size is reported as 0.
class RangedFileSystem : public IFileSystem
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    RangedFileSystem(std::shared_ptr<Store::IObjectStore> store, Store::ByteRange range);
    ~RangedFileSystem() override = default;

    RangedFileSystem(const RangedFileSystem&)            = delete;
    RangedFileSystem& operator=(const RangedFileSystem&) = delete;
    RangedFileSystem(RangedFileSystem&&)                 = delete;
    RangedFileSystem& operator=(RangedFileSystem&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // IFileSystem Implementation
    FileResult<std::unique_ptr<IFile>> Open(std::string_view name) override;

    const Store::ByteRange& GetRange() const noexcept { return range_; }

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    std::int64_t LookupTotalSize(const std::string& key);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::shared_ptr<Store::IObjectStore> store_;
    const Store::ByteRange range_;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_RANGED_FILE_SYSTEM_HPP_
