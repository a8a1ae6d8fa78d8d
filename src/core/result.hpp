#pragma once

#include <string>
#include <variant>

namespace arbguard {

// Value or error message, used where a failure is an expected outcome
template<typename T>
class Result {
private:
    std::variant<T, std::string> value_;

public:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(std::string error) : value_(std::move(error)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(std::string error) {
        return Result<T>(std::move(error));
    }

    bool is_success() const {
        return std::holds_alternative<T>(value_);
    }

    bool is_error() const {
        return std::holds_alternative<std::string>(value_);
    }

    const T& value() const {
        return std::get<T>(value_);
    }

    const std::string& error() const {
        return std::get<std::string>(value_);
    }
};

} // namespace arbguard
