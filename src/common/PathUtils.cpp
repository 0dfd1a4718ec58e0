#include "common/PathUtils.h"

#include <system_error>

namespace tradeagent {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path path(relative_path);
    if (path.is_absolute()) {
        return path;
    }

    std::error_code ec;
    auto from_cwd = std::filesystem::current_path(ec) / path;
    if (!ec && std::filesystem::exists(from_cwd, ec)) {
        return from_cwd;
    }
    return getExecutableDir() / path;
}

} // namespace utils
} // namespace tradeagent
