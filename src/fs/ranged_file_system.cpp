#include "fs/ranged_file_system.hpp"
#include "fs/object_file.hpp"
#include "fs/path_utils.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace S3Fs::Fs
{

RangedFileSystem::RangedFileSystem(
    std::shared_ptr<Store::IObjectStore> store, Store::ByteRange range
)
    : store_(std::move(store)), range_(range)
{
    if (!store_) {
        throw std::invalid_argument("RangedFileSystem requires an object store.");
    }
}

FileResult<std::unique_ptr<IFile>> RangedFileSystem::Open(std::string_view name)
{
    auto key = BaseName(name);
    spdlog::debug(
        "RangedFileSystem::Open('{}') -> '{}/{}', {}", name, store_->GetBucket(), key,
        range_.ToHeader()
    );

    auto object = store_->GetObject(key, range_);
    if (!object) {
        spdlog::trace(
            "RangedFileSystem::Open failed for '{}/{}': {}", store_->GetBucket(), key,
            object.error().message()
        );
        return std::unexpected(MapStoreError(object.error()));
    }

    auto total_size = LookupTotalSize(key);
    FileStat stat(std::move(key), total_size, object->metadata.last_modified);
    return std::make_unique<ObjectFile>(std::move(stat), std::move(object->body));
}

std::int64_t RangedFileSystem::LookupTotalSize(const std::string& key)
{
    auto head = store_->HeadObject(key);
    if (!head) {
        spdlog::warn(
            "RangedFileSystem: size lookup for '{}/{}' failed ({}), reporting size 0",
            store_->GetBucket(), key, head.error().message()
        );
        return 0;
    }
    return head->content_length;
}

}  // namespace S3Fs::Fs
