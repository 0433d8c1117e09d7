#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace pbu {

/**
 * @brief Failure categories reported by the uploader
 *
 * PreconditionFailed is raised before any store call is made.
 * AppendFailed / FinishFailed carry the store's reason verbatim.
 */
enum class ErrorCode {
    InvalidArgument,
    PreconditionFailed,
    IoError,
    NotFound,
    AppendFailed,
    FinishFailed,
    UnexpectedResponse,
    PollTimeout,
    ConfigError
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::PreconditionFailed: return "precondition_failed";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AppendFailed: return "append_failed";
        case ErrorCode::FinishFailed: return "finish_failed";
        case ErrorCode::UnexpectedResponse: return "unexpected_response";
        case ErrorCode::PollTimeout: return "poll_timeout";
        case ErrorCode::ConfigError: return "config_error";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string to_string() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.to_string();
}

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace pbu
