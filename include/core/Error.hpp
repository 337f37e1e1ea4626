#ifndef ERROR_HPP
#define ERROR_HPP

#include <string>
#include <optional>
#include <utility>

enum class ErrorKind
{
    NONE,
    NETWORK,
    TIMEOUT,
    PROTOCOL,
    IO,
    ARCHIVE,
    MANIFEST,
    CONCURRENCY_LIMIT,
    NOT_FOUND,
    NOT_READY
};

struct Error
{
    ErrorKind kind{ErrorKind::NONE};
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::NONE; }
};

const char *errorKindName(ErrorKind kind);

// Holds either a value or the error that prevented producing it
template <typename T>
class Result
{
public:
    Result(T value) : _value(std::move(value)) {}
    Result(Error error) : _error(std::move(error)) {}

    bool ok() const { return _value.has_value(); }
    explicit operator bool() const { return ok(); }

    T &value() { return *_value; }
    const T &value() const { return *_value; }
    T *operator->() { return &*_value; }
    const T *operator->() const { return &*_value; }

    const Error &error() const { return _error; }

private:
    std::optional<T> _value;
    Error _error;
};

// Result for operations that produce nothing but may fail
class Status
{
public:
    Status() = default;
    Status(Error error) : _error(std::move(error)) {}

    bool ok() const { return !_error; }
    explicit operator bool() const { return ok(); }
    const Error &error() const { return _error; }

private:
    Error _error;
};

#endif
