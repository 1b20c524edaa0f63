#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cloudgrid {

enum class ErrorKind {
    Generic,
    UnresolvableIdentity,  // reserved: markAsFailed absorbs unresolved names, never returned
    MissingResults,
    UnknownTarget,
    InvalidConfig,
};

const char* errorKindName(ErrorKind kind) noexcept;

//-----------------------------------------------------------------------------
// Error - message + kind, optionally chained to the error that caused it
//-----------------------------------------------------------------------------
class Error {
public:
    Error() = default;
    explicit Error(std::string message, ErrorKind kind = ErrorKind::Generic)
        : _message(std::move(message)), _kind(kind) {}
    Error(std::string message, ErrorKind kind, const Error& cause)
        : _message(std::move(message))
        , _kind(kind)
        , _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    ErrorKind kind() const { return _kind; }
    const std::shared_ptr<Error>& cause() const { return _cause; }

    // Full chain: "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->_cause) {
            out += ": ";
            out += c->_message;
        }
        return out;
    }

private:
    std::string _message;
    ErrorKind _kind = ErrorKind::Generic;
    std::shared_ptr<Error> _cause;
};

//-----------------------------------------------------------------------------
// Result<T>
//-----------------------------------------------------------------------------
template<typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : _storage(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _storage(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return _storage.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_storage); }
    const T& value() const& { return std::get<0>(_storage); }
    T&& value() && { return std::get<0>(std::move(_storage)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_storage); }

private:
    std::variant<T, Error> _storage;
};

template<>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Err(std::string message, ErrorKind kind = ErrorKind::Generic) {
    return Result<T>(Error(std::move(message), kind));
}

// Wrap the error of a failed result, keeping its kind
template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error().kind(), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace cloudgrid
