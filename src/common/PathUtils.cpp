#include "common/PathUtils.h"

#include <system_error>

namespace swingfib {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::error_code ec;
    const auto from_cwd = std::filesystem::absolute(relative_path, ec);
    if (!ec && std::filesystem::exists(from_cwd, ec)) {
        return from_cwd;
    }
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace swingfib
