// =============================================================================
// Tether - Result type
// =============================================================================
// Either a value or an error. Expected failures (adb timeouts, refused
// sockets, a missing registry file) come back as errors; exceptions are kept
// for broken invariants.
//
//   Result<std::string> r = readSomething();
//   if (r.is_err()) { TLOG_WARN(..., r.error().message); return; }
//   use(r.value());
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace tether {

struct Error {
    std::string message;
    int code = 0;   // errno or exit status where one exists

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
};

// Failure touching a file, socket or child process
struct IoError : Error {
    enum class Kind {
        NotFound,
        PermissionDenied,
        ConnectionRefused,
        Timeout,
        Other
    };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other, int errno_value = 0)
        : Error(std::move(msg), errno_value), kind(k) {}
};

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    // Throws std::runtime_error when holding an error
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    const E& error() const {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }

    const E& error() const {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

} // namespace tether
