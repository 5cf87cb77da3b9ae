#pragma once

#include <string>
#include <vector>

namespace pep2rpm {

// fnmatch-style match of a whole name against a pattern.
// Supports: * (any run of characters), ? (single character),
//           [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& name);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Apply ordered include/exclude patterns to a list of names.
// Patterns prefixed with '!' exclude; others include; the last matching
// pattern wins. Returns the selected names in their original order.
std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& names);

} // namespace pep2rpm
