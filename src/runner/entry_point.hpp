#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ojrunner::runner {

struct EntryPoint {
    std::string main_class_name;
    std::optional<std::string> package_name;

    std::string QualifiedName() const;
};

// Throws EntryPointError when the public class or main method is missing.
EntryPoint DetectEntryPoint(const std::string& source);

// Reads `path` and runs DetectEntryPoint on its contents.
EntryPoint DetectEntryPointInFile(const std::filesystem::path& path);

}  // namespace ojrunner::runner
