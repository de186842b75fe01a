#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "../config.hpp"
#include "../reader_base.hpp"

namespace cogreader {

/**
 * @brief RangeFetcher over HTTP(S), backed by libcurl
 *
 * Every call performs one blocking request on a fresh easy handle, so a single
 * fetcher can be shared by several threads. Ranged GETs send
 * `Range: bytes=<first>-<last>`; content_length() issues a HEAD.
 *
 * Any curl failure (including a timeout from FetchOptions) or an HTTP status
 * of 400 and above is reported as Error::Code::TransportError.
 */
class CurlRangeFetcher {
private:
    std::string url_;
    FetchOptions options_;

public:
    explicit CurlRangeFetcher(std::string url, FetchOptions options = {});

    /// @brief GET the inclusive byte range [first, last]
    /// @retval Error::Code::TransportError The request failed or the server answered >= 400
    [[nodiscard]] Result<std::vector<std::byte>> fetch_range(std::size_t first, std::size_t last) const noexcept;

    /// @brief HEAD request for the Content-Length of the resource
    /// @retval Error::Code::TransportError The request failed or the length is unknown
    [[nodiscard]] Result<std::size_t> content_length() const noexcept;

    [[nodiscard]] std::string_view location() const noexcept { return url_; }

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }
};

} // namespace cogreader

#define COGREADER_CURL_FETCHER_HEADER
#include "impl/curl_fetcher_impl.hpp"
