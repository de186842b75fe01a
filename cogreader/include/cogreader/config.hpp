#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "types/result.hpp"

namespace cogreader {

/// Default size of one aligned cache chunk, in bytes
inline constexpr std::size_t kDefaultChunkSize = 4000;

/**
 * @brief Tunables of the remote byte source
 *
 * Values can be overlaid from the environment with from_environment():
 *
 * | Variable                        | Field             | Unit    |
 * |---------------------------------|-------------------|---------|
 * | COGREADER_CHUNK_SIZE            | chunk_size        | bytes   |
 * | COGREADER_HTTP_TIMEOUT          | timeout           | seconds |
 * | COGREADER_HTTP_CONNECTTIMEOUT   | connect_timeout   | seconds |
 * | COGREADER_HTTP_USERAGENT        | user_agent        | text    |
 *
 * A zero timeout disables the corresponding limit.
 */
struct FetchOptions {
    std::size_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    std::string user_agent = "cogreader";
    bool follow_redirects = true;

    /// @brief Overlay environment variables on a base configuration
    /// @param base Values used for every variable that is not set
    /// @return The merged options
    /// @retval Error::Code::InvalidArgument A variable holds a malformed or out-of-range number
    [[nodiscard]] static Result<FetchOptions> from_environment(FetchOptions base) noexcept;

    /// @brief Overlay environment variables on the defaults
    [[nodiscard]] static Result<FetchOptions> from_environment() noexcept;

    /// @brief Check option consistency
    /// @retval Error::Code::InvalidArgument chunk_size is zero
    [[nodiscard]] Result<void> validate() const noexcept;
};

namespace config_detail {

/// @brief Read an environment variable, nullopt when unset or empty
[[nodiscard]] std::optional<std::string_view> get_env(const char* name) noexcept;

/// @brief Parse a strictly positive integer
[[nodiscard]] Result<std::size_t> parse_positive(const char* name, std::string_view text) noexcept;

/// @brief Parse a non-negative number of seconds (fractions allowed) into milliseconds
[[nodiscard]] Result<std::chrono::milliseconds> parse_seconds(const char* name, std::string_view text) noexcept;

} // namespace config_detail

} // namespace cogreader

#define COGREADER_CONFIG_HEADER
#include "impl/config_impl.hpp"
