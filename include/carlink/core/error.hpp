#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <stdexcept>
#include <optional>
#include <source_location>

#include <carlink/core/logger.hpp>

namespace carlink::core {

enum class ErrorCode {
    Success = 0,
    Unknown,
    InvalidArgument,
    InvalidState,
    NotSupported,

    // Protocol errors (relay wire events)
    InvalidMessage,
    MissingField,

    // Routing errors
    UnknownTarget,
    NotInRoom,

    // Transport errors
    NegotiationFailed,
    TransportFailed,
    ConnectionFailed,
    ConnectionClosed,
    ConnectionTimeout,

    // Codec errors
    MalformedFrame,

    // Resource errors
    ResourceNotFound,
    FileNotFound,
    FileAccessDenied,
    InvalidData
};

// Kategori "carlink"; kode dipetakan ke std::errc bila ada padanannya
class ErrorCategory : public std::error_category {
public:
    static const ErrorCategory& instance() {
        static ErrorCategory instance;
        return instance;
    }

    const char* name() const noexcept override { return "carlink"; }

    std::string message(int ev) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;

private:
    ErrorCategory() = default;
};

inline std::error_code make_error_code(ErrorCode e) {
    return {static_cast<int>(e), ErrorCategory::instance()};
}

// Exception carlink: kode, pesan, dan lokasi sumber. Setiap Error yang dibuat
// dicatat di level debug.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code,
          std::string_view message,
          const std::source_location& location = std::source_location::current())
        : std::runtime_error(std::string(message))
        , code_(code)
        , location_(location) {
        Logger::debug("[{}] {} at {}:{}",
            ErrorCategory::instance().message(static_cast<int>(code)),
            message,
            location.file_name(),
            location.line());
    }

    ErrorCode code() const noexcept { return code_; }
    const std::source_location& location() const noexcept { return location_; }
    std::error_code error_code() const noexcept { return make_error_code(code_); }

private:
    ErrorCode code_;
    std::source_location location_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string_view message,
                                     const std::source_location& location = std::source_location::current()) {
    throw Error(code, message, location);
}

namespace detail {

// Bagian Result yang tidak bergantung pada T: error opsional beserta query-nya
class ResultState {
public:
    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    const Error& error() const {
        if (!error_) throw_error(ErrorCode::InvalidState, "Result contains no error");
        return *error_;
    }

protected:
    ResultState() = default;
    explicit ResultState(Error error) : error_(std::move(error)) {}

    void rethrow() const {
        if (error_) throw *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace detail

// Nilai atau Error; operasi yang bisa gagal mengembalikan ini alih-alih throw
template<typename T>
class Result : public detail::ResultState {
public:
    Result(T value) : value_(std::move(value)) {}

    Result(ErrorCode code, std::string_view message,
           const std::source_location& location = std::source_location::current())
        : ResultState(Error(code, message, location)) {}

    Result(Error error) : ResultState(std::move(error)) {}

    const T& value() const& {
        rethrow();
        return *value_;
    }

    T&& value() && {
        rethrow();
        return std::move(*value_);
    }

    template<typename U>
    T value_or(U&& fallback) const& {
        return is_ok() ? *value_ : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::optional<T> value_;
};

template<>
class Result<void> : public detail::ResultState {
public:
    Result() = default;

    Result(ErrorCode code, std::string_view message,
           const std::source_location& location = std::source_location::current())
        : ResultState(Error(code, message, location)) {}

    Result(Error error) : ResultState(std::move(error)) {}

    void value() const {
        rethrow();
    }
};

} // namespace carlink::core

template<>
struct std::is_error_code_enum<carlink::core::ErrorCode> : std::true_type {};
