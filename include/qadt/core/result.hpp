#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace qadt {

/**
 * @brief Failure categories surfaced by the core
 *
 * Transport    backend command failed (non-zero exit, unparsable output)
 * Timeout      command or lock acquisition exceeded its deadline
 * ProcessSpawn capture/helper process could not be started
 * Writer       log file could not be opened or written
 * StaleState   operation not valid for the current session state
 */
enum class ErrorKind {
    Transport,
    Timeout,
    ProcessSpawn,
    Writer,
    StaleState,
    NotFound,
    Io,
    InvalidArgument
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ProcessSpawn: return "process_spawn";
        case ErrorKind::Writer: return "writer";
        case ErrorKind::StaleState: return "stale_state";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Io: return "io";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

// Wrappers so Result<T, E> stays unambiguous when T == E
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
public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace qadt
