#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

namespace tabedit {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies errors for exit codes and structured output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    NameConflict,
    InvalidValue,
    InvalidMove,
    NotFound,
    ParseError,
    ConfigError,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type for model edits.
//
// `target` names the object the operation addressed (its model path), or is
// empty for operations that are not about a single object.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::NameConflict: return 2;
            case ErrorCategory::InvalidValue: return 3;
            case ErrorCategory::InvalidMove:  return 4;
            case ErrorCategory::NotFound:     return 5;
            case ErrorCategory::ParseError:   return 6;
            case ErrorCategory::ConfigError:  return 7;
            case ErrorCategory::Internal:     return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::NameConflict: return "name_conflict";
            case ErrorCategory::InvalidValue: return "invalid_value";
            case ErrorCategory::InvalidMove:  return "invalid_move";
            case ErrorCategory::NotFound:     return "not_found";
            case ErrorCategory::ParseError:   return "parse_error";
            case ErrorCategory::ConfigError:  return "config";
            case ErrorCategory::Internal:     return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        oss << ": " << message;
        return oss.str();
    }

    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace tabedit
