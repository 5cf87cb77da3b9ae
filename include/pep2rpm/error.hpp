#pragma once

#include <string>
#include <utility>

namespace pep2rpm {

struct Pep2RpmError {
    enum Code {
        MalformedVersion,
        UnsupportedMarkerVariable,
        InvalidSpecifierOperator,
        InconsistentLocalSegment,
        Parse,
        Config,
        IO,
        InvalidArg
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    Pep2RpmError() = default;
    Pep2RpmError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    Pep2RpmError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    Pep2RpmError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pep2rpm
