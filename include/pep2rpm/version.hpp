#pragma once

#include <pep2rpm/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pep2rpm {

// Pre-release phases in PEP 440 order: a < b < rc
enum class PrePhase { Alpha, Beta, Candidate };

const char* phase_tag(PrePhase phase);

struct PreRelease {
    PrePhase phase = PrePhase::Alpha;
    std::uint64_t number = 0;

    bool operator==(const PreRelease& o) const {
        return phase == o.phase && number == o.number;
    }
};

// PEP 440 version: [N!]N(.N)*[{a|b|rc}N][.postN][.devN][+local]
//
// parse() accepts every spelling PEP 440 normalizes (case, leading 'v',
// alpha/beta/c/pre/preview/rev/r, '-' '_' '.' separators, implicit numbers,
// "1.0-1" implicit post releases) and stores the normalized components.
struct Version {
    std::uint64_t epoch = 0;
    std::vector<std::uint64_t> release;
    std::optional<PreRelease> pre;
    std::optional<std::uint64_t> post;
    std::optional<std::uint64_t> dev;
    std::vector<std::string> local;  // lower-cased, separators dropped

    static Result<Version> parse(const std::string& s);

    // Normalized PEP 440 form
    std::string to_string() const;
    // Release segments joined by '.', e.g. "1.5.3"
    std::string release_string() const;

    bool is_prerelease() const { return pre.has_value() || dev.has_value(); }

    // Total PEP 440 order; -1, 0 or 1
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

} // namespace pep2rpm
