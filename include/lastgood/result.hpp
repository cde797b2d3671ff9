#pragma once

#include <lastgood/error.hpp>
#include <variant>

namespace lastgood {

template<typename T>
class Result {
    std::variant<T, LastgoodError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from LastgoodError so LASTGOOD_TRY can return errors across Result<T> types
    Result(LastgoodError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(LastgoodError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<LastgoodError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    LastgoodError& error() & { return std::get<LastgoodError>(data_); }
    const LastgoodError& error() const& { return std::get<LastgoodError>(data_); }
    LastgoodError&& error() && { return std::get<LastgoodError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Attach a higher-level message to an Err, pass Ok through untouched
    Result with_context(std::string msg) && {
        if (is_err()) {
            std::get<LastgoodError>(data_).context(std::move(msg));
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define LASTGOOD_TRY(expr) \
    do { \
        auto _lastgood_result = (expr); \
        if (_lastgood_result.is_err()) return std::move(_lastgood_result).error(); \
    } while(0)

} // namespace lastgood
