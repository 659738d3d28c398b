#include "runner/workspace.hpp"

#include <cerrno>
#include <iostream>
#include <system_error>
#include <unistd.h>
#include <vector>

#include "utils/logging.hpp"

namespace ojrunner::runner {

ScopedWorkspace::ScopedWorkspace(const std::string& prefix,
                                 const std::filesystem::path& parent) {
    const auto pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::filesystem::filesystem_error(
            "cannot create workspace",
            parent,
            std::error_code(errno, std::generic_category()));
    }
    path_ = std::filesystem::path(buffer.data());
    if (utils::LogEnabled(utils::LogLevel::kDebug)) {
        std::cerr << "[workspace] created " << path_.string() << std::endl;
    }
}

ScopedWorkspace::~ScopedWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[workspace] failed to remove " << path_.string()
                  << ": " << ec.message() << std::endl;
        return;
    }
    if (utils::LogEnabled(utils::LogLevel::kDebug)) {
        std::cerr << "[workspace] removed " << path_.string() << std::endl;
    }
}

}  // namespace ojrunner::runner
