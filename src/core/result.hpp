#pragma once

#include <string>
#include <utility>
#include <variant>

namespace arbgate {

// Value-or-error for operations whose failure is an expected outcome.
// T must not be std::string.
template<typename T>
class Result {
private:
    std::variant<T, std::string> value_;

    struct ErrorTag {};
    Result(ErrorTag, std::string error) : value_(std::in_place_index<1>, std::move(error)) {}

public:
    explicit Result(T value) : value_(std::in_place_index<0>, std::move(value)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(std::string error) {
        return Result<T>(ErrorTag{}, std::move(error));
    }

    bool is_success() const {
        return value_.index() == 0;
    }

    bool is_error() const {
        return value_.index() == 1;
    }

    explicit operator bool() const {
        return is_success();
    }

    const T& value() const {
        return std::get<0>(value_);
    }

    T& value() {
        return std::get<0>(value_);
    }

    const std::string& error() const {
        return std::get<1>(value_);
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_success()) {
            return Result<U>::success(f(value()));
        }
        return Result<U>::error(error());
    }
};

} // namespace arbgate
