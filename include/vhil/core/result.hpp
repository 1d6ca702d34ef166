#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>

namespace vhil::core {

// Error domain shared by the configuration, transport and fixture layers
enum class Errc {
    kSuccess = 0,
    kNotFound,
    kInvalidArgument,
    kCorruption,
    kIoError,
    kUnavailable,
    kHandlerFailed,
    kUnknown
};

inline constexpr std::string_view ToString(Errc e) {
    switch (e) {
        case Errc::kSuccess:         return "success";
        case Errc::kNotFound:        return "not found";
        case Errc::kInvalidArgument: return "invalid argument";
        case Errc::kCorruption:      return "corruption";
        case Errc::kIoError:         return "io error";
        case Errc::kUnavailable:     return "unavailable";
        case Errc::kHandlerFailed:   return "handler failed";
        default:                     return "unknown";
    }
}

class ErrorCode {
public:
    Errc value;
    std::string detail;
    ErrorCode(Errc v) : value(v) {}
    ErrorCode(Errc v, std::string d) : value(v), detail(std::move(d)) {}
    operator bool() const { return value != Errc::kSuccess; }

    std::string Message() const {
        std::string m(ToString(value));
        if (!detail.empty()) { m += ": "; m += detail; }
        return m;
    }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(Errc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace vhil::core
