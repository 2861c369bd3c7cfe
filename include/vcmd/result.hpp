#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vcmd {

//=============================================================================
// Error - message plus an optional chained cause
//=============================================================================

class Error {
public:
    explicit Error(std::string message) : _message(std::move(message)) {}

    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }

    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = _cause.get(); e; e = e->_cause.get()) {
            out += ": ";
            out += e->_message;
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

//=============================================================================
// Result<T>
//=============================================================================

template<typename T>
class Result {
public:
    Result(T value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return _data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() { return std::get<0>(_data); }
    const T& value() const { return std::get<0>(_data); }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    std::variant<T, Error> _data;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : _error(std::make_shared<Error>(std::move(error))) {}

    bool has_value() const { return !_error; }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::shared_ptr<Error> _error;
};

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return Result<T>(Error(std::move(message)));
    }
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace vcmd
