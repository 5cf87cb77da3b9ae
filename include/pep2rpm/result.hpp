#pragma once

#include <pep2rpm/error.hpp>
#include <utility>
#include <variant>

namespace pep2rpm {

template<typename T>
class Result {
    std::variant<T, Pep2RpmError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from Pep2RpmError so PEP2RPM_TRY can return errors across Result<T> types
    Result(Pep2RpmError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(Pep2RpmError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<Pep2RpmError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    Pep2RpmError& error() & { return std::get<Pep2RpmError>(data_); }
    const Pep2RpmError& error() const& { return std::get<Pep2RpmError>(data_); }
    Pep2RpmError&& error() && { return std::get<Pep2RpmError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PEP2RPM_TRY(expr) \
    do { \
        auto _pep2rpm_result = (expr); \
        if (_pep2rpm_result.is_err()) return std::move(_pep2rpm_result).error(); \
    } while(0)

} // namespace pep2rpm
