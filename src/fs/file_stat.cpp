#include "fs/file_stat.hpp"
#include "app_constants.hpp"

#include <utility>

namespace S3Fs::Fs
{

FileStat::FileStat(
    std::string name, std::int64_t size, std::chrono::system_clock::time_point mod_time
)
    : name_(std::move(name)), size_(size), mod_time_(mod_time)
{
}

mode_t FileStat::Mode() const noexcept { return Constants::DEFAULT_FILE_MODE; }

struct stat FileStat::ToStat() const
{
    struct stat stbuf{};

    stbuf.st_mode  = S_IFREG | Mode();
    stbuf.st_nlink = 1;
    stbuf.st_size  = static_cast<off_t>(size_);

    auto since_epoch = mod_time_.time_since_epoch();
    // floor keeps tv_nsec in [0, 1e9) for times before the epoch
    auto secs        = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nsecs       = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);

    stbuf.st_mtim.tv_sec  = static_cast<time_t>(secs.count());
    stbuf.st_mtim.tv_nsec = static_cast<long>(nsecs.count());
    stbuf.st_atim         = stbuf.st_mtim;
    stbuf.st_ctim         = stbuf.st_mtim;
    return stbuf;
}

}  // namespace S3Fs::Fs
