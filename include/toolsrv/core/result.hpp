#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace toolsrv {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
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

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
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
// Result<void, E>: specialization for operations that succeed with no value.
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
// ErrorCategory: the failure taxonomy shared by every component.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    ToolNotFound,
    DuplicateTool,
    Validation,
    RateLimitExceeded,
    ExecutionTimeout,
    ExecutionFailed,
    Cancelled,
    ContextKeyNotFound,
    Config,
    Transport,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error returned by all fallible operations.
//
// `detail` is server-side diagnostic text (exception messages, internal
// state). It is logged but never serialized to clients.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> detail;

    /// Stable protocol-level code.
    [[nodiscard]] std::string Code() const {
        switch (category) {
            case ErrorCategory::ToolNotFound:       return "ToolNotFound";
            case ErrorCategory::DuplicateTool:      return "DuplicateTool";
            case ErrorCategory::Validation:         return "ValidationError";
            case ErrorCategory::RateLimitExceeded:  return "RateLimitExceeded";
            case ErrorCategory::ExecutionTimeout:   return "ExecutionTimeout";
            case ErrorCategory::ExecutionFailed:    return "ExecutionFailed";
            case ErrorCategory::Cancelled:          return "Cancelled";
            case ErrorCategory::ContextKeyNotFound: return "ContextKeyNotFound";
            case ErrorCategory::Config:             return "ConfigError";
            case ErrorCategory::Transport:          return "TransportError";
            case ErrorCategory::Internal:           return "InternalError";
        }
        return "InternalError";
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::ToolNotFound:       return "tool_not_found";
            case ErrorCategory::DuplicateTool:      return "duplicate_tool";
            case ErrorCategory::Validation:         return "validation";
            case ErrorCategory::RateLimitExceeded:  return "rate_limit";
            case ErrorCategory::ExecutionTimeout:   return "timeout";
            case ErrorCategory::ExecutionFailed:    return "execution";
            case ErrorCategory::Cancelled:          return "cancelled";
            case ErrorCategory::ContextKeyNotFound: return "context_key_not_found";
            case ErrorCategory::Config:             return "config";
            case ErrorCategory::Transport:          return "transport";
            case ErrorCategory::Internal:           return "internal";
        }
        return "internal";
    }

    /// JSON-RPC 2.0 error code. -32000..-32099 is the server-defined range.
    [[nodiscard]] int RpcCode() const {
        switch (category) {
            case ErrorCategory::Validation:         return -32602;
            case ErrorCategory::ToolNotFound:       return -32001;
            case ErrorCategory::DuplicateTool:      return -32002;
            case ErrorCategory::RateLimitExceeded:  return -32003;
            case ErrorCategory::ExecutionTimeout:   return -32004;
            case ErrorCategory::ExecutionFailed:    return -32005;
            case ErrorCategory::Cancelled:          return -32006;
            case ErrorCategory::ContextKeyNotFound: return -32007;
            case ErrorCategory::Config:             return -32603;
            case ErrorCategory::Transport:          return -32603;
            case ErrorCategory::Internal:           return -32603;
        }
        return -32603;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:    return 1;
            case ErrorCategory::Transport: return 2;
            case ErrorCategory::Internal:  return 99;
            default:                       return 99;
        }
    }

    /// Message safe to hand to a client. Internal errors are opaque.
    [[nodiscard]] std::string ClientMessage() const {
        if (category == ErrorCategory::Internal) {
            return "Internal error";
        }
        return message;
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation << " [" << Code() << "]: " << message;
        if (detail.has_value() && !detail->empty()) {
            oss << " (" << *detail << ")";
        }
        return oss.str();
    }

    /// Client-facing {code, message} object.
    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"code", Code()}, {"message", ClientMessage()}};
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               category == other.category &&
               detail == other.detail;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace toolsrv
