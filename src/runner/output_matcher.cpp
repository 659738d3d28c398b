#include "runner/output_matcher.hpp"

namespace ojrunner::runner {

std::string NormalizeOutput(const std::string& value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '\r') {
            normalized += '\n';
            if (i + 1 < value.size() && value[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        normalized += ch;
    }
    const auto end = normalized.find_last_not_of(" \t\n\v\f");
    if (end == std::string::npos) {
        return {};
    }
    normalized.erase(end + 1);
    return normalized;
}

std::optional<bool> MatchOutput(const std::string& actual,
                                const std::optional<std::string>& expected) {
    if (!expected) {
        return std::nullopt;
    }
    return NormalizeOutput(actual) == NormalizeOutput(*expected);
}

}  // namespace ojrunner::runner
