// Do not include this file directly. Include "cogreader/config.hpp" instead.

#pragma once

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include "../types/result.hpp"

#ifndef COGREADER_CONFIG_HEADER
#include "../config.hpp" // for linters
#endif

namespace cogreader {

namespace config_detail {

inline std::optional<std::string_view> get_env(const char* name) noexcept {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string_view(value);
}

inline Result<std::size_t> parse_positive(const char* name, std::string_view text) noexcept {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   std::string(name) + ": expected a positive integer, got '" + std::string(text) + "'");
    }
    if (value == 0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, std::string(name) + " must be greater than 0");
    }
    return Ok(value);
}

inline Result<std::chrono::milliseconds> parse_seconds(const char* name, std::string_view text) noexcept {
    double seconds = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(seconds)) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   std::string(name) + ": expected a number of seconds, got '" + std::string(text) + "'");
    }
    if (seconds < 0.0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, std::string(name) + " must not be negative");
    }
    return Ok(std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0))));
}

} // namespace config_detail

inline Result<FetchOptions> FetchOptions::from_environment(FetchOptions base) noexcept {
    if (auto text = config_detail::get_env("COGREADER_CHUNK_SIZE")) {
        auto parsed = config_detail::parse_positive("COGREADER_CHUNK_SIZE", *text);
        if (!parsed) {
            return parsed.error();
        }
        base.chunk_size = parsed.value();
    }
    if (auto text = config_detail::get_env("COGREADER_HTTP_TIMEOUT")) {
        auto parsed = config_detail::parse_seconds("COGREADER_HTTP_TIMEOUT", *text);
        if (!parsed) {
            return parsed.error();
        }
        base.timeout = parsed.value();
    }
    if (auto text = config_detail::get_env("COGREADER_HTTP_CONNECTTIMEOUT")) {
        auto parsed = config_detail::parse_seconds("COGREADER_HTTP_CONNECTTIMEOUT", *text);
        if (!parsed) {
            return parsed.error();
        }
        base.connect_timeout = parsed.value();
    }
    if (auto text = config_detail::get_env("COGREADER_HTTP_USERAGENT")) {
        base.user_agent = std::string(*text);
    }
    return Ok(std::move(base));
}

inline Result<FetchOptions> FetchOptions::from_environment() noexcept {
    return from_environment(FetchOptions{});
}

inline Result<void> FetchOptions::validate() const noexcept {
    if (chunk_size == 0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "chunk_size must be greater than 0");
    }
    return Ok();
}

} // namespace cogreader
