#pragma once

#include <optional>
#include <string>

namespace ojrunner::runner {

// CRLF and lone CR become LF, then trailing whitespace is stripped.
// Leading and interior whitespace is kept.
std::string NormalizeOutput(const std::string& value);

// Absent when there is nothing to compare against.
std::optional<bool> MatchOutput(const std::string& actual,
                                const std::optional<std::string>& expected);

}  // namespace ojrunner::runner
