#include "runner/entry_point.hpp"

#include <fstream>
#include <regex>
#include <sstream>

#include "runner/errors.hpp"

namespace ojrunner::runner {
namespace {

const std::regex& PackageRegex() {
    static const std::regex re(R"(^package\s+([A-Za-z0-9_.]+)\s*;)");
    return re;
}

const std::regex& PublicClassRegex() {
    static const std::regex re(R"(\bpublic\s+(?:final\s+)?class\s+([A-Za-z_$][A-Za-z0-9_$]*))");
    return re;
}

// Group 1 holds the modifiers, which may come in any order.
const std::regex& MainMethodRegex() {
    static const std::regex re(
        R"(\b((?:(?:public|static|final|synchronized|strictfp)\s+)+)void\s+main\s*\(\s*(?:final\s+)?)"
        R"((?:java\s*\.\s*lang\s*\.\s*)?)"
        R"((?:String\s*(?:\[\s*\]|\.\.\.)|String\s+[A-Za-z_$][A-Za-z0-9_$]*\s*\[\s*\]))");
    return re;
}

bool HasModifier(const std::string& modifiers, const std::string& word) {
    const std::regex re("\\b" + word + "\\b");
    return std::regex_search(modifiers, re);
}

bool HasMainMethod(const std::string& source) {
    for (std::sregex_iterator it(source.begin(), source.end(), MainMethodRegex()), end; it != end; ++it) {
        const auto modifiers = (*it)[1].str();
        if (HasModifier(modifiers, "public") && HasModifier(modifiers, "static")) {
            return true;
        }
    }
    return false;
}

// Leading whitespace, UTF-8 BOM and zero-width spaces do not move a line off
// statement position.
std::string StripLinePrefix(const std::string& line) {
    static const std::string kBom = "\xEF\xBB\xBF";
    static const std::string kZeroWidthSpace = "\xE2\x80\x8B";
    std::size_t pos = 0;
    while (pos < line.size()) {
        if (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r' || line[pos] == '\f') {
            ++pos;
        } else if (line.compare(pos, kBom.size(), kBom) == 0) {
            pos += kBom.size();
        } else if (line.compare(pos, kZeroWidthSpace.size(), kZeroWidthSpace) == 0) {
            pos += kZeroWidthSpace.size();
        } else {
            break;
        }
    }
    return line.substr(pos);
}

std::optional<std::string> FindPackage(const std::string& source) {
    std::istringstream stream(source);
    std::string line;
    std::smatch match;
    while (std::getline(stream, line)) {
        const auto stripped = StripLinePrefix(line);
        if (std::regex_search(stripped, match, PackageRegex())) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

}  // namespace

std::string EntryPoint::QualifiedName() const {
    if (package_name && !package_name->empty()) {
        return *package_name + "." + main_class_name;
    }
    return main_class_name;
}

EntryPoint DetectEntryPoint(const std::string& source) {
    std::smatch class_match;
    if (!std::regex_search(source, class_match, PublicClassRegex())) {
        throw EntryPointError("cannot identify a public entry class: declare a public class");
    }
    if (!HasMainMethod(source)) {
        throw EntryPointError("no runnable entry method found: expected public static void main(String[] args)");
    }

    EntryPoint entry{};
    entry.main_class_name = class_match[1].str();
    entry.package_name = FindPackage(source);
    return entry;
}

EntryPoint DetectEntryPointInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ValidationError("cannot read source file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return DetectEntryPoint(buffer.str());
}

}  // namespace ojrunner::runner
