#include "fs/plain_file_system.hpp"
#include "fs/object_file.hpp"
#include "fs/path_utils.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace S3Fs::Fs
{

PlainFileSystem::PlainFileSystem(std::shared_ptr<Store::IObjectStore> store)
    : store_(std::move(store))
{
    if (!store_) {
        throw std::invalid_argument("PlainFileSystem requires an object store.");
    }
}

FileResult<std::unique_ptr<IFile>> PlainFileSystem::Open(std::string_view name)
{
    auto key = BaseName(name);
    spdlog::debug(
        "PlainFileSystem::Open('{}') -> '{}/{}'", name, store_->GetBucket(), key
    );

    auto object = store_->GetObject(key, std::nullopt);
    if (!object) {
        spdlog::trace(
            "PlainFileSystem::Open failed for '{}/{}': {}", store_->GetBucket(), key,
            object.error().message()
        );
        return std::unexpected(MapStoreError(object.error()));
    }

    FileStat stat(
        std::move(key), object->metadata.content_length, object->metadata.last_modified
    );
    return std::make_unique<ObjectFile>(std::move(stat), std::move(object->body));
}

}  // namespace S3Fs::Fs
