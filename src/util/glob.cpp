#include <pep2rpm/glob.hpp>

namespace pep2rpm {

// Match str[si..] against pat[pi..]
static bool match_from(const std::string& pat, size_t pi,
                       const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            // Consecutive stars collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_from(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (si == str.size()) return false;

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            size_t close = pat.find(']', pi + 2);
            if (close == std::string::npos) {
                // Unterminated class: '[' is a literal
                if (str[si] != '[') return false;
                pi++;
                si++;
                continue;
            }
            size_t ci = pi + 1;
            bool negate = false;
            if (pat[ci] == '!') {
                negate = true;
                ci++;
            }
            bool matched = false;
            char sc = str[si];
            while (ci < close) {
                char lo = pat[ci];
                if (ci + 2 < close && pat[ci + 1] == '-') {
                    char hi = pat[ci + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    ci += 3;
                } else {
                    if (sc == lo) matched = true;
                    ci++;
                }
            }
            if (matched == negate) return false;
            pi = close + 1;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    return si == str.size();
}

bool glob_match(const std::string& pattern, const std::string& name) {
    return match_from(pattern, 0, name, 0);
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& names)
{
    std::vector<std::string> result;

    for (const auto& name : names) {
        bool included = false;
        for (const auto& pat : patterns) {
            std::string inner;
            if (glob_is_negation(pat, inner)) {
                if (glob_match(inner, name)) {
                    included = false;
                }
            } else if (glob_match(pat, name)) {
                included = true;
            }
        }
        if (included) {
            result.push_back(name);
        }
    }

    return result;
}

} // namespace pep2rpm
