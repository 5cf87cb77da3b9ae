#include <pep2rpm/rpm_label.hpp>
#include <cctype>
#include <cstring>

namespace pep2rpm {

static bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

int rpmvercmp(const std::string& a, const std::string& b) {
    if (a == b) return 0;

    const char* one = a.c_str();
    const char* two = b.c_str();

    while (*one || *two) {
        while (*one && !is_alnum(*one) && *one != '~' && *one != '^') one++;
        while (*two && !is_alnum(*two) && *two != '~' && *two != '^') two++;

        // Tilde sorts before everything else
        if (*one == '~' || *two == '~') {
            if (*one != '~') return 1;
            if (*two != '~') return -1;
            one++;
            two++;
            continue;
        }

        // Caret is like tilde, except that the end of the string sorts lower
        if (*one == '^' || *two == '^') {
            if (!*one) return -1;
            if (!*two) return 1;
            if (*one != '^') return 1;
            if (*two != '^') return -1;
            one++;
            two++;
            continue;
        }

        if (!(*one && *two)) break;

        const char* p = one;
        const char* q = two;
        bool numeric = is_digit(*p);
        if (numeric) {
            while (*p && is_digit(*p)) p++;
            while (*q && is_digit(*q)) q++;
        } else {
            while (*p && std::isalpha(static_cast<unsigned char>(*p))) p++;
            while (*q && std::isalpha(static_cast<unsigned char>(*q))) q++;
        }

        // Segments of different kinds: numeric is newer
        if (q == two) return numeric ? 1 : -1;

        std::string seg1(one, p);
        std::string seg2(two, q);
        if (numeric) {
            size_t z1 = seg1.find_first_not_of('0');
            size_t z2 = seg2.find_first_not_of('0');
            seg1 = z1 == std::string::npos ? "" : seg1.substr(z1);
            seg2 = z2 == std::string::npos ? "" : seg2.substr(z2);
            if (seg1.size() != seg2.size()) return seg1.size() > seg2.size() ? 1 : -1;
        }
        int rc = std::strcmp(seg1.c_str(), seg2.c_str());
        if (rc) return rc < 0 ? -1 : 1;

        one = p;
        two = q;
    }

    if (!*one && !*two) return 0;
    // Whichever string still has characters left is newer
    return *one ? 1 : -1;
}

Evr Evr::split(const std::string& label) {
    Evr evr;
    std::string rest = label;

    size_t colon = rest.find(':');
    if (colon != std::string::npos) {
        std::string e = rest.substr(0, colon);
        bool digits = !e.empty() && e.size() <= 19;
        for (char c : e) digits = digits && is_digit(c);
        if (digits) {
            evr.epoch = std::stoull(e);
            rest = rest.substr(colon + 1);
        }
    }

    size_t dash = rest.rfind('-');
    if (dash != std::string::npos) {
        evr.release = rest.substr(dash + 1);
        rest = rest.substr(0, dash);
    }
    evr.version = rest;
    return evr;
}

int rpm_compare(const std::string& a, const std::string& b) {
    Evr x = Evr::split(a);
    Evr y = Evr::split(b);

    if (x.epoch != y.epoch) return x.epoch < y.epoch ? -1 : 1;
    if (int rc = rpmvercmp(x.version, y.version)) return rc;
    if (x.release.empty() || y.release.empty()) return 0;
    return rpmvercmp(x.release, y.release);
}

} // namespace pep2rpm
