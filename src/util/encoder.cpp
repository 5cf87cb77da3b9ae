#include <pep2rpm/encoder.hpp>
#include <pep2rpm/log.hpp>
#include <algorithm>
#include <cctype>

namespace pep2rpm {

static bool mixes_letters_and_digits(const std::string& segment) {
    bool alpha = std::any_of(segment.begin(), segment.end(),
        [](char c) { return std::isalpha(static_cast<unsigned char>(c)); });
    bool digit = std::any_of(segment.begin(), segment.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    return alpha && digit;
}

Result<std::string> VersionOrderEncoder::encode(const Version& v) const {
    if (v.release.empty()) {
        return Pep2RpmError{Pep2RpmError::MalformedVersion,
            "version has no release segments"};
    }

    std::string out;
    if (v.epoch != 0) {
        out += std::to_string(v.epoch) + ":";
    }

    for (size_t i = 0; i < v.release.size(); ++i) {
        if (i > 0) out += ".";
        out += std::to_string(v.release[i]);
    }

    if (v.pre) {
        out += "~";
        out += phase_tag(v.pre->phase);
        out += std::to_string(v.pre->number);
    }
    if (v.post) {
        out += ".post" + std::to_string(*v.post);
    }
    // Double tilde: below "~a0", and below the end of a pre/post label
    if (v.dev) {
        out += "~~dev" + std::to_string(*v.dev);
    }

    if (!v.local.empty()) {
        for (const auto& segment : v.local) {
            if (!mixes_letters_and_digits(segment)) continue;
            if (policy_ == LocalPolicy::Strict) {
                return Pep2RpmError{Pep2RpmError::InconsistentLocalSegment,
                    "local version segment '" + segment + "' of '" + v.to_string() +
                    "' mixes letters and digits",
                    "RPM compares letters and digits as separate segments; "
                    "use the best-effort local policy to encode it anyway"};
            }
            log::warn("local segment '%s' of %s may not sort as in PEP 440",
                      segment.c_str(), v.to_string().c_str());
        }
        out += "^";
        for (size_t i = 0; i < v.local.size(); ++i) {
            if (i > 0) out += ".";
            out += v.local[i];
        }
    }

    return Result<std::string>::ok(std::move(out));
}

Result<std::string> VersionOrderEncoder::encode(const std::string& literal) const {
    auto v = Version::parse(literal);
    if (v.is_err()) return std::move(v).error();
    return encode(v.value());
}

} // namespace pep2rpm
