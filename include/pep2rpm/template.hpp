#pragma once

#include <pep2rpm/result.hpp>
#include <string>
#include <vector>

namespace pep2rpm {

// Capability name template with one named placeholder, e.g. "python-{name}"
// or "python({arch})". The placeholder may appear more than once; "{{" and
// "}}" stand for literal braces. Templates without a placeholder are fixed
// names such as "python(abi)".
class NameTemplate {
public:
    static Result<NameTemplate> parse(const std::string& text);

    std::string format(const std::string& value) const;

    const std::string& text() const { return text_; }
    const std::string& placeholder() const { return placeholder_; }
    bool has_placeholder() const { return !placeholder_.empty(); }

private:
    std::string text_;
    std::string placeholder_;
    // Literal pieces; the placeholder goes between consecutive pieces
    std::vector<std::string> pieces_;
};

} // namespace pep2rpm
