#include "fs/path_utils.hpp"

namespace S3Fs::Fs
{

std::string BaseName(std::string_view name)
{
    if (name.empty()) {
        return ".";
    }

    while (!name.empty() && name.back() == '/') {
        name.remove_suffix(1);
    }
    if (name.empty()) {
        return "/";
    }

    auto slash = name.rfind('/');
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    return std::string(name);
}

}  // namespace S3Fs::Fs
