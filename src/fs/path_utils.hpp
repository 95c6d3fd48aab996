#ifndef S3FS_SRC_FS_PATH_UTILS_HPP_
#define S3FS_SRC_FS_PATH_UTILS_HPP_

#include <string>
#include <string_view>

namespace S3Fs::Fs
{

// Last element of a slash-separated path. Trailing slashes are dropped first; an empty name
// yields "." and a name of only slashes yields "/".
//
// Every file system here addresses one flat key space through this function, so "a/x.txt" and
// "b/x.txt" name the same object "x.txt".
std::string BaseName(std::string_view name);

}  // namespace S3Fs::Fs

#endif  // S3FS_SRC_FS_PATH_UTILS_HPP_
