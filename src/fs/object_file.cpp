#include "fs/object_file.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace S3Fs::Fs
{

ObjectFile::ObjectFile(FileStat stat, std::unique_ptr<Store::IObjectBody> body)
    : stat_(std::move(stat)), body_(std::move(body))
{
}

ObjectFile::~ObjectFile()
{
    if (body_) {
        spdlog::debug("ObjectFile '{}' destroyed without Close()", stat_.Name());
        auto res = body_->Close();
        if (!res) {
            spdlog::error(
                "~ObjectFile: failed to release body of '{}': {}", stat_.Name(),
                res.error().message()
            );
        }
    }
}

ReadResult ObjectFile::Read(std::span<std::byte> buffer)
{
    if (!body_) {
        return {0, make_error_code(FileErrc::FileClosed)};
    }

    std::size_t total = 0;
    while (total < buffer.size()) {
        auto res = body_->Read(buffer.subspan(total));
        if (!res) {
            spdlog::warn(
                "ObjectFile::Read '{}' failed after {} bytes: {}", stat_.Name(), total,
                res.error().message()
            );
            return {total, res.error()};
        }
        if (*res == 0) {
            return {total, make_error_code(total == 0 ? FileErrc::EndOfFile : FileErrc::UnexpectedEof)};
        }
        total += *res;
    }
    return {total, {}};
}

FileResult<std::int64_t> ObjectFile::Seek(std::int64_t offset, SeekOrigin /*origin*/)
{
    spdlog::trace("ObjectFile::Seek '{}' to {} ignored", stat_.Name(), offset);
    return 0;
}

const FileStat& ObjectFile::Stat() const { return stat_; }

FileResult<std::vector<FileStat>> ObjectFile::Readdir(int /*count*/)
{
    return std::vector<FileStat>{};
}

FileResult<void> ObjectFile::Close()
{
    if (!body_) {
        return std::unexpected(make_error_code(FileErrc::FileClosed));
    }

    auto body = std::move(body_);
    auto res  = body->Close();
    if (!res) {
        spdlog::warn("ObjectFile::Close '{}': {}", stat_.Name(), res.error().message());
        return std::unexpected(res.error());
    }
    return {};
}

}  // namespace S3Fs::Fs
