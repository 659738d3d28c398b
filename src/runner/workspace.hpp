#pragma once

#include <filesystem>
#include <string>

namespace ojrunner::runner {

// Owns a freshly created temporary directory and removes it, with everything
// inside, when the guard goes out of scope. Removal errors are logged only.
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(const std::string& prefix,
                             const std::filesystem::path& parent = std::filesystem::temp_directory_path());
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;
    ScopedWorkspace(ScopedWorkspace&&) = delete;
    ScopedWorkspace& operator=(ScopedWorkspace&&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace ojrunner::runner
