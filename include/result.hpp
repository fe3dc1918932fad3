/**
 * @file result.hpp
 * @brief Result type for engine error handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_RESULT_HPP
#define TIERGUARD_RESULT_HPP

#include <string>
#include <variant>
#include <optional>
#include <type_traits>
#include <utility>

namespace tierguard {

enum class ErrorCode {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1, INVALID_ARGUMENT = 3, TIMEOUT = 5, CANCELLED = 6, INVALID_STATE = 7,
    NOT_FOUND = 100, ALREADY_EXISTS = 101, RESOURCE_BUSY = 105,
    BACKEND_NOT_FOUND = 110, BACKEND_DISABLED = 111,
    TIER_FULL = 200, IO_ERROR = 204, STATE_VERSION_MISMATCH = 206,
    ADAPTER_TIMEOUT = 300, ADAPTER_ERROR = 301, INSUFFICIENT_REDUNDANCY = 302,
    RETENTION_LOCKED = 303,
    CONFIG_INVALID = 400, CONFIG_PARSE_ERROR = 402, INVALID_POLICY = 403, QUOTA_EXCEEDED = 404,
    INTERNAL_ERROR = 503
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::INVALID_STATE: return "INVALID_STATE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case ErrorCode::RESOURCE_BUSY: return "RESOURCE_BUSY";
        case ErrorCode::BACKEND_NOT_FOUND: return "BACKEND_NOT_FOUND";
        case ErrorCode::BACKEND_DISABLED: return "BACKEND_DISABLED";
        case ErrorCode::TIER_FULL: return "TIER_FULL";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::STATE_VERSION_MISMATCH: return "STATE_VERSION_MISMATCH";
        case ErrorCode::ADAPTER_TIMEOUT: return "ADAPTER_TIMEOUT";
        case ErrorCode::ADAPTER_ERROR: return "ADAPTER_ERROR";
        case ErrorCode::INSUFFICIENT_REDUNDANCY: return "INSUFFICIENT_REDUNDANCY";
        case ErrorCode::RETENTION_LOCKED: return "RETENTION_LOCKED";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::INVALID_POLICY: return "INVALID_POLICY";
        case ErrorCode::QUOTA_EXCEEDED: return "QUOTA_EXCEEDED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @struct Error
 * @brief Failure carried by Result: a code, a message and where it happened
 *
 * context names the object, backend or file line the failure concerns.
 * Nested calls add their own context in front, outermost first.
 */
struct Error {
    ErrorCode code = ErrorCode::UNKNOWN_ERROR;
    std::string message;
    std::string context;

    Error() = default;
    Error(ErrorCode c, std::string msg = "") : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    [[nodiscard]] std::string toString() const {
        std::string out = errorCodeToString(code);
        if (!message.empty()) out += ": " + message;
        if (!context.empty()) out += " [" + context + "]";
        return out;
    }

    [[nodiscard]] bool is(ErrorCode c) const { return code == c; }

    /// Transient adapter conditions worth retrying
    [[nodiscard]] bool isRetryable() const {
        return code == ErrorCode::ADAPTER_TIMEOUT || code == ErrorCode::ADAPTER_ERROR ||
               code == ErrorCode::RESOURCE_BUSY;
    }

    /// A policy refused the operation; the backend itself is healthy
    [[nodiscard]] bool isRefusal() const {
        return code == ErrorCode::QUOTA_EXCEEDED || code == ErrorCode::RETENTION_LOCKED ||
               code == ErrorCode::BACKEND_DISABLED || code == ErrorCode::TIER_FULL;
    }

    [[nodiscard]] Error within(const std::string& outer) const {
        Error e = *this;
        e.context = context.empty() ? outer : outer + " / " + context;
        return e;
    }
};

template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& err) : data_(err) {}
    Result(Error&& err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : data_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool isError() const { return std::holds_alternative<Error>(data_); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    [[nodiscard]] const T* operator->() const { return &std::get<T>(data_); }
    [[nodiscard]] T* operator->() { return &std::get<T>(data_); }
    [[nodiscard]] const T& operator*() const& { return std::get<T>(data_); }
    [[nodiscard]] T& operator*() & { return std::get<T>(data_); }

    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (isError()) return Result(error().within(ctx));
        return *this;
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(const Error& err) : error_(err) {}
    Result(Error&& err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : error_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return !error_.has_value(); }
    [[nodiscard]] bool isError() const { return error_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const Error& error() const { return *error_; }

    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (isError()) return Result(error_->within(ctx));
        return *this;
    }

private:
    std::optional<Error> error_;
};

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) { return Result<std::decay_t<T>>(std::forward<T>(value)); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(ErrorCode code, const std::string& msg = "") {
    return Result<T>(code, msg);
}

template<typename T>
Result<T> Err(const Error& err) { return Result<T>(err); }

inline Result<void> Err(ErrorCode code, const std::string& msg = "") {
    return Result<void>(code, msg);
}

inline Result<void> Err(const Error& err) { return Result<void>(err); }

} // namespace tierguard

#endif // TIERGUARD_RESULT_HPP
