#ifndef S3FS_SRC_FS_FILE_STAT_HPP_
#define S3FS_SRC_FS_FILE_STAT_HPP_

#include <sys/stat.h>
#include <any>
#include <chrono>
#include <cstdint>
#include <string>

namespace S3Fs::Fs
{

// Immutable metadata snapshot taken when a file is opened
class FileStat
{
    public:
    FileStat(std::string name, std::int64_t size, std::chrono::system_clock::time_point mod_time);

    const std::string& Name() const noexcept { return name_; }

    // For ranged files this is the size of the whole object, not of the readable slice.
    std::int64_t Size() const noexcept { return size_; }

    mode_t Mode() const noexcept;
    std::chrono::system_clock::time_point ModTime() const noexcept { return mod_time_; }
    bool IsDir() const noexcept { return false; }

    // Platform-specific extension slot, always empty
    std::any Sys() const { return {}; }

    struct stat ToStat() const;

    private:
    std::string name_;
    std::int64_t size_;
    std::chrono::system_clock::time_point mod_time_;
};

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_FILE_STAT_HPP_
