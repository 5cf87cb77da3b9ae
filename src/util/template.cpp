#include <pep2rpm/template.hpp>
#include <cctype>

namespace pep2rpm {

Result<NameTemplate> NameTemplate::parse(const std::string& text) {
    NameTemplate t;
    t.text_ = text;

    std::string piece;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '{' && i + 1 < text.size() && text[i + 1] == '{') {
            piece.push_back('{');
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < text.size() && text[i + 1] == '}') {
            piece.push_back('}');
            i += 2;
            continue;
        }
        if (c == '}') {
            return Pep2RpmError{Pep2RpmError::Config,
                "unmatched '}' in template '" + text + "'",
                "write '}}' for a literal brace"};
        }
        if (c != '{') {
            piece.push_back(c);
            ++i;
            continue;
        }

        size_t close = text.find('}', i + 1);
        if (close == std::string::npos) {
            return Pep2RpmError{Pep2RpmError::Config,
                "unterminated placeholder in template '" + text + "'"};
        }
        std::string name = text.substr(i + 1, close - i - 1);
        if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
            return Pep2RpmError{Pep2RpmError::Config,
                "invalid placeholder '{" + name + "}' in template '" + text + "'",
                "placeholders are identifiers such as {name} or {arch}"};
        }
        for (char n : name) {
            if (!std::isalnum(static_cast<unsigned char>(n)) && n != '_') {
                return Pep2RpmError{Pep2RpmError::Config,
                    "invalid placeholder '{" + name + "}' in template '" + text + "'"};
            }
        }
        if (!t.placeholder_.empty() && t.placeholder_ != name) {
            return Pep2RpmError{Pep2RpmError::Config,
                "template '" + text + "' uses both {" + t.placeholder_ + "} and {" + name + "}",
                "a capability template takes a single value"};
        }
        t.placeholder_ = name;
        t.pieces_.push_back(std::move(piece));
        piece.clear();
        i = close + 1;
    }
    t.pieces_.push_back(std::move(piece));

    return Result<NameTemplate>::ok(std::move(t));
}

std::string NameTemplate::format(const std::string& value) const {
    std::string out = pieces_.empty() ? std::string() : pieces_[0];
    for (size_t i = 1; i < pieces_.size(); ++i) {
        out += value;
        out += pieces_[i];
    }
    return out;
}

} // namespace pep2rpm
