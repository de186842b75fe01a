#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cogreader {

/// @brief Broad failure families a caller may want to branch on
enum class ErrorKind {
    None,               ///< Not an error
    Format,             ///< Malformed or inconsistent binary structure
    Unsupported,        ///< Valid input using an unimplemented feature
    Transport,          ///< The byte source failed to deliver
    InsufficientData,   ///< A decoded tile is shorter than its pixel window
    Usage               ///< Bad request from the caller (level, window, option)
};

/// Error type for COG decoding operations
struct Error {
    enum class Code {
        Success,
        // Format
        InvalidHeader,
        InvalidFormat,
        InvalidTag,
        InvalidTagType,
        CompressionError,
        // Unsupported
        UnsupportedFeature,
        // Transport
        TransportError,
        UnexpectedEndOfFile,
        // Pixel data
        InsufficientData,
        // Usage
        OutOfBounds,
        InvalidLevel,
        InvalidArgument,
        MissingGeoKeys
    };

    Code code;
    std::string message;

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] constexpr bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return code != Code::Success;
    }

    /// @brief Failure family of this error
    [[nodiscard]] constexpr ErrorKind kind() const noexcept;

    /// @brief Message prefixed with the failure family, e.g. "invalid format: bad magic"
    [[nodiscard]] std::string describe() const;
};

/// @brief Map a fine-grained code onto its failure family
[[nodiscard]] constexpr ErrorKind error_kind(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success:
            return ErrorKind::None;
        case Error::Code::InvalidHeader:
        case Error::Code::InvalidFormat:
        case Error::Code::InvalidTag:
        case Error::Code::InvalidTagType:
        case Error::Code::CompressionError:
            return ErrorKind::Format;
        case Error::Code::UnsupportedFeature:
            return ErrorKind::Unsupported;
        case Error::Code::TransportError:
        case Error::Code::UnexpectedEndOfFile:
            return ErrorKind::Transport;
        case Error::Code::InsufficientData:
            return ErrorKind::InsufficientData;
        case Error::Code::OutOfBounds:
        case Error::Code::InvalidLevel:
        case Error::Code::InvalidArgument:
        case Error::Code::MissingGeoKeys:
            return ErrorKind::Usage;
    }
    return ErrorKind::Usage;
}

constexpr ErrorKind Error::kind() const noexcept {
    return error_kind(code);
}

inline std::string Error::describe() const {
    std::string_view prefix;
    switch (kind()) {
        case ErrorKind::None:             prefix = ""; break;
        case ErrorKind::Format:           prefix = "invalid format: "; break;
        case ErrorKind::Unsupported:      prefix = "unsupported feature: "; break;
        case ErrorKind::Transport:        prefix = "transport error: "; break;
        case ErrorKind::InsufficientData: prefix = "insufficient data: "; break;
        case ErrorKind::Usage:            prefix = "invalid request: "; break;
    }
    return std::string(prefix) + message;
}

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::forward<T>(value)) {}

    constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(value) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) && {
        if (is_ok()) {
            return std::move(value());
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) const& -> decltype(func(std::declval<const T&>())) {
        if (is_ok()) {
            return func(value());
        }
        using RetType = decltype(func(std::declval<const T&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) && -> decltype(func(std::declval<T&&>())) {
        if (is_ok()) {
            return func(std::move(value()));
        }
        using RetType = decltype(func(std::declval<T&&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) const& {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>{func(value())};
        }
        return Result<U>{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) && {
        using U = decltype(func(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>{func(std::move(value()))};
        }
        return Result<U>{error()};
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    constexpr Result() noexcept : data_(std::monostate{}) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace cogreader
