#include <pep2rpm/error.hpp>

namespace pep2rpm {

const char* Pep2RpmError::code_name(Code c) {
    switch (c) {
        case MalformedVersion:          return "MalformedVersion";
        case UnsupportedMarkerVariable: return "UnsupportedMarkerVariable";
        case InvalidSpecifierOperator:  return "InvalidSpecifierOperator";
        case InconsistentLocalSegment:  return "InconsistentLocalSegment";
        case Parse:                     return "Parse";
        case Config:                    return "Config";
        case IO:                        return "IO";
        case InvalidArg:                return "InvalidArg";
    }
    return "Unknown";
}

std::string Pep2RpmError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace pep2rpm
