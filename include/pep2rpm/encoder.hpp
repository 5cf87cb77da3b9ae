#pragma once

#include <pep2rpm/result.hpp>
#include <pep2rpm/version.hpp>
#include <string>

namespace pep2rpm {

// What to do with a local version segment that mixes letters and digits
// ("cu118"): PEP 440 compares it as one string, RPM splits it into an alpha
// and a numeric segment, so the two orders can disagree.
enum class LocalPolicy {
    BestEffort,  // encode anyway, log a warning
    Strict       // fail with InconsistentLocalSegment
};

// Encodes PEP 440 versions into RPM [epoch:]version labels whose rpmvercmp
// order is the PEP 440 order:
//
//   1!2.0        -> 1:2.0
//   1.0.dev1     -> 1.0~~dev1
//   1.0a1        -> 1.0~a1
//   1.0rc2.post1 -> 1.0~rc2.post1
//   1.0          -> 1.0
//   1.0.post1    -> 1.0.post1
//   1.0+ubuntu.2 -> 1.0^ubuntu.2
//
// Release segments are written as given, so versions that differ only in
// trailing zeros ("1.0", "1.0.0") are equal under PEP 440 but not under
// RPM. Local labels need an RPM with caret support (4.15 or later).
class VersionOrderEncoder {
public:
    explicit VersionOrderEncoder(LocalPolicy policy = LocalPolicy::BestEffort)
        : policy_(policy) {}

    Result<std::string> encode(const Version& v) const;
    Result<std::string> encode(const std::string& literal) const;

    LocalPolicy policy() const { return policy_; }

private:
    LocalPolicy policy_;
};

} // namespace pep2rpm
