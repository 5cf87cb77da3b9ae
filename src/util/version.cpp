#include <pep2rpm/version.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace pep2rpm {

const char* phase_tag(PrePhase phase) {
    switch (phase) {
    case PrePhase::Alpha:     return "a";
    case PrePhase::Beta:      return "b";
    case PrePhase::Candidate: return "rc";
    }
    return "";
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

bool is_separator(char c) {
    return c == '.' || c == '-' || c == '_';
}

struct VersionScanner {
    std::string input;  // lower-cased, trimmed
    size_t pos = 0;

    explicit VersionScanner(std::string s) : input(std::move(s)) {}

    bool at_end() const { return pos >= input.size(); }

    bool at_digit() const {
        return !at_end() && std::isdigit(static_cast<unsigned char>(input[pos]));
    }

    bool try_consume(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (input.compare(pos, len, word) == 0) {
            pos += len;
            return true;
        }
        return false;
    }

    bool try_separator() {
        if (!at_end() && is_separator(input[pos])) {
            ++pos;
            return true;
        }
        return false;
    }

    // Digits at pos; caller checks at_digit() first
    bool number(std::uint64_t& out) {
        out = 0;
        const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() / 10;
        while (at_digit()) {
            std::uint64_t d = static_cast<std::uint64_t>(input[pos] - '0');
            if (out > limit || (out == limit && d > std::numeric_limits<std::uint64_t>::max() % 10)) {
                return false;
            }
            out = out * 10 + d;
            ++pos;
        }
        return true;
    }

    // [sep]N where both parts are optional; N defaults to 0
    bool optional_number(std::uint64_t& out) {
        size_t saved = pos;
        try_separator();
        if (at_digit()) return number(out);
        pos = saved;
        out = 0;
        return true;
    }
};

Pep2RpmError malformed(const std::string& s, const std::string& what) {
    return Pep2RpmError{Pep2RpmError::MalformedVersion,
        "invalid version '" + s + "': " + what,
        "expected a PEP 440 version such as 1.0, 2!1.4.post2 or 3.0rc1.dev4+local.7"};
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

Result<Version> Version::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return Pep2RpmError{Pep2RpmError::MalformedVersion, "empty version string"};
    }

    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    VersionScanner sc(std::move(lowered));
    Version v;

    if (!sc.at_end() && sc.input[0] == 'v') ++sc.pos;

    // Epoch or first release segment
    if (!sc.at_digit()) {
        return malformed(text, "expected a release number");
    }
    std::uint64_t n = 0;
    if (!sc.number(n)) return malformed(text, "number out of range");
    if (!sc.at_end() && sc.input[sc.pos] == '!') {
        ++sc.pos;
        v.epoch = n;
        if (!sc.at_digit()) return malformed(text, "expected a release number after epoch");
        if (!sc.number(n)) return malformed(text, "number out of range");
    }
    v.release.push_back(n);

    while (sc.pos + 1 < sc.input.size() && sc.input[sc.pos] == '.' &&
           std::isdigit(static_cast<unsigned char>(sc.input[sc.pos + 1]))) {
        ++sc.pos;
        if (!sc.number(n)) return malformed(text, "number out of range");
        v.release.push_back(n);
    }

    // Pre-release
    {
        size_t saved = sc.pos;
        sc.try_separator();
        static const std::pair<const char*, PrePhase> spellings[] = {
            {"alpha", PrePhase::Alpha},
            {"a", PrePhase::Alpha},
            {"beta", PrePhase::Beta},
            {"b", PrePhase::Beta},
            {"preview", PrePhase::Candidate},
            {"pre", PrePhase::Candidate},
            {"rc", PrePhase::Candidate},
            {"c", PrePhase::Candidate},
        };
        bool matched = false;
        for (const auto& [word, phase] : spellings) {
            if (sc.try_consume(word)) {
                PreRelease pre;
                pre.phase = phase;
                if (!sc.optional_number(pre.number)) return malformed(text, "number out of range");
                v.pre = pre;
                matched = true;
                break;
            }
        }
        if (!matched) sc.pos = saved;
    }

    // Post-release, explicit or implicit ("1.0-1")
    {
        size_t saved = sc.pos;
        if (!sc.at_end() && sc.input[sc.pos] == '-' && sc.pos + 1 < sc.input.size() &&
            std::isdigit(static_cast<unsigned char>(sc.input[sc.pos + 1]))) {
            ++sc.pos;
            std::uint64_t post = 0;
            if (!sc.number(post)) return malformed(text, "number out of range");
            v.post = post;
        } else {
            sc.try_separator();
            if (sc.try_consume("post") || sc.try_consume("rev") || sc.try_consume("r")) {
                std::uint64_t post = 0;
                if (!sc.optional_number(post)) return malformed(text, "number out of range");
                v.post = post;
            } else {
                sc.pos = saved;
            }
        }
    }

    // Dev-release
    {
        size_t saved = sc.pos;
        sc.try_separator();
        if (sc.try_consume("dev")) {
            std::uint64_t dev = 0;
            if (!sc.optional_number(dev)) return malformed(text, "number out of range");
            v.dev = dev;
        } else {
            sc.pos = saved;
        }
    }

    // Local version label
    if (!sc.at_end() && sc.input[sc.pos] == '+') {
        ++sc.pos;
        std::string part;
        while (!sc.at_end()) {
            char c = sc.input[sc.pos];
            if (std::isalnum(static_cast<unsigned char>(c))) {
                part.push_back(c);
            } else if (is_separator(c)) {
                if (part.empty()) return malformed(text, "empty local version segment");
                v.local.push_back(std::move(part));
                part.clear();
            } else {
                return malformed(text, std::string("unexpected character '") + c + "' in local version");
            }
            ++sc.pos;
        }
        if (part.empty()) return malformed(text, "empty local version segment");
        v.local.push_back(std::move(part));
    }

    if (!sc.at_end()) {
        return malformed(text, "unexpected trailing characters '" + sc.input.substr(sc.pos) + "'");
    }

    return Result<Version>::ok(std::move(v));
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::string Version::release_string() const {
    std::string s;
    for (size_t i = 0; i < release.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(release[i]);
    }
    return s;
}

std::string Version::to_string() const {
    std::string s;
    if (epoch != 0) {
        s += std::to_string(epoch) + "!";
    }
    s += release_string();
    if (pre) {
        s += phase_tag(pre->phase);
        s += std::to_string(pre->number);
    }
    if (post) s += ".post" + std::to_string(*post);
    if (dev) s += ".dev" + std::to_string(*dev);
    for (size_t i = 0; i < local.size(); ++i) {
        s += (i == 0) ? "+" : ".";
        s += local[i];
    }
    return s;
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

namespace {

template<typename T>
int cmp(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

// Release segments compare as if padded with zeros
int compare_release(const std::vector<std::uint64_t>& a, const std::vector<std::uint64_t>& b) {
    size_t len = std::max(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        std::uint64_t x = i < a.size() ? a[i] : 0;
        std::uint64_t y = i < b.size() ? b[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}

// Pre-release rank: a dev release without pre or post sorts before every
// pre-release, a final release after all of them.
int pre_rank(const Version& v, PreRelease& out) {
    if (v.pre) {
        out = *v.pre;
        return 1;
    }
    if (!v.post && v.dev) return 0;
    return 2;
}

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// Numeric local segments compare as integers and sort above alphanumeric ones
int compare_local_segment(const std::string& a, const std::string& b) {
    bool an = is_numeric(a);
    bool bn = is_numeric(b);
    if (an && bn) {
        size_t ai = a.find_first_not_of('0');
        size_t bi = b.find_first_not_of('0');
        std::string at = ai == std::string::npos ? "" : a.substr(ai);
        std::string bt = bi == std::string::npos ? "" : b.substr(bi);
        if (at.size() != bt.size()) return at.size() < bt.size() ? -1 : 1;
        return cmp(at, bt);
    }
    if (an != bn) return an ? 1 : -1;
    return cmp(a, b);
}

} // anonymous namespace

int Version::compare(const Version& o) const {
    if (int c = cmp(epoch, o.epoch)) return c;
    if (int c = compare_release(release, o.release)) return c;

    PreRelease pa, pb;
    int ra = pre_rank(*this, pa);
    int rb = pre_rank(o, pb);
    if (int c = cmp(ra, rb)) return c;
    if (ra == 1) {
        if (int c = cmp(static_cast<int>(pa.phase), static_cast<int>(pb.phase))) return c;
        if (int c = cmp(pa.number, pb.number)) return c;
    }

    // No post release sorts first
    if (post.has_value() != o.post.has_value()) return post.has_value() ? 1 : -1;
    if (post) {
        if (int c = cmp(*post, *o.post)) return c;
    }

    // No dev release sorts last
    if (dev.has_value() != o.dev.has_value()) return dev.has_value() ? -1 : 1;
    if (dev) {
        if (int c = cmp(*dev, *o.dev)) return c;
    }

    size_t len = std::min(local.size(), o.local.size());
    for (size_t i = 0; i < len; ++i) {
        if (int c = compare_local_segment(local[i], o.local[i])) return c;
    }
    return cmp(local.size(), o.local.size());
}

} // namespace pep2rpm
