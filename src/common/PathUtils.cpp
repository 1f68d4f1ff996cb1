#include "common/PathUtils.h"

#include <system_error>

namespace cyclebt {
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
    const auto cwd_candidate = std::filesystem::current_path(ec) / relative_path;
    if (!ec && std::filesystem::exists(cwd_candidate, ec)) {
        return cwd_candidate;
    }
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace cyclebt
