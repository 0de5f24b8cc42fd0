/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exception crosses a sqlitexx boundary - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sqlitexx
{

/// Error categories for sqlitexx operations
enum class errc : std::uint16_t
{
    success = 0,

    // Open errors (100-199)
    open_failed = 100,
    pragma_update = 101,

    // Engine errors (200-299)
    execution_failed = 200,

    // Lifecycle errors (300-599)
    closed = 300,
    panic = 400,
    join_failed = 500,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(errc ec) noexcept
{
    switch (ec)
    {
        case errc::success: return "Success";
        case errc::open_failed: return "Open failed";
        case errc::pragma_update: return "Pragma update failed";
        case errc::execution_failed: return "Execution failed";
        case errc::closed: return "Connection closed";
        case errc::panic: return "Job panicked";
        case errc::join_failed: return "Thread join failed";
        case errc::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Rich error type with code, message and the SQLite extended result code
class error
{
public:
    error() noexcept : code_(errc::success) {}

    explicit error(errc code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(errc code, std::string message)
        : code_(code), message_(std::move(message)) {}

    error(errc code, std::string message, int engine_code)
        : code_(code), message_(std::move(message)), engine_code_(engine_code) {}

    [[nodiscard]] errc code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// Extended SQLite result code, 0 when the error did not come from the engine
    [[nodiscard]] int engine_code() const noexcept { return engine_code_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == errc::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
        if (engine_code_ != 0)
            out += " (sqlite " + std::to_string(engine_code_) + ")";
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(errc ec) const noexcept { return code_ == ec; }

    /// Check if the storage or its thread could not be opened
    [[nodiscard]] bool is_open_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 100 && c < 200;
    }

    /// Check if the error was raised by the engine itself
    [[nodiscard]] bool is_engine_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 200 && c < 300;
    }

private:
    errc code_;
    std::string message_;
    int engine_code_ = 0;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

template<typename>
struct is_result : std::false_type {};

template<typename T>
struct is_result<std::expected<T, error>> : std::true_type {};

template<typename T>
inline constexpr bool is_result_v = is_result<std::remove_cvref_t<T>>::value;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(errc code, std::string message, int engine_code)
{
    return std::unexpected(error(code, std::move(message), engine_code));
}

} // namespace sqlitexx
