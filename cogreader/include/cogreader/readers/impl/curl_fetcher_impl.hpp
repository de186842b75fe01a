// Do not include this file directly. Include "cogreader/readers/curl_fetcher.hpp" instead.

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "../../logging.hpp"

#ifndef COGREADER_CURL_FETCHER_HEADER
#include "../curl_fetcher.hpp" // for linters
#endif

namespace cogreader {

namespace curl_detail {

struct EasyHandleDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

/// curl_global_init is not thread-safe; run it once per process
[[nodiscard]] inline CURLcode global_init() noexcept {
    static std::once_flag flag;
    static CURLcode status = CURLE_OK;
    std::call_once(flag, [] { status = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return status;
}

struct WriteBuffer {
    std::vector<std::byte>* bytes;
    bool out_of_memory = false;
};

inline std::size_t write_callback(char* data, std::size_t size, std::size_t nmemb, void* user) {
    auto* sink = static_cast<WriteBuffer*>(user);
    std::size_t count = size * nmemb;
    try {
        auto* first = reinterpret_cast<const std::byte*>(data);
        sink->bytes->insert(sink->bytes->end(), first, first + count);
    } catch (const std::bad_alloc&) {
        sink->out_of_memory = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    return count;
}

/// @brief Create an easy handle with the options shared by GET and HEAD
[[nodiscard]] inline Result<EasyHandle> make_handle(const std::string& url, const FetchOptions& options) noexcept {
    CURLcode init_status = global_init();
    if (init_status != CURLE_OK) [[unlikely]] {
        return Err(Error::Code::TransportError,
                   std::string("curl_global_init failed: ") + curl_easy_strerror(init_status));
    }
    EasyHandle handle(curl_easy_init());
    if (!handle) [[unlikely]] {
        return Err(Error::Code::TransportError, "curl_easy_init failed");
    }
    CURL* h = handle.get();
    CURLcode status = curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_USERAGENT, options.user_agent.c_str());
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    if (status != CURLE_OK) [[unlikely]] {
        return Err(Error::Code::TransportError, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(status));
    }
    return Ok(std::move(handle));
}

/// @brief Run the request and turn curl / HTTP failures into errors
[[nodiscard]] inline Result<long> perform(CURL* handle, const std::string& what) noexcept {
    CURLcode status = curl_easy_perform(handle);
    if (status != CURLE_OK) [[unlikely]] {
        auto error = Err(Error::Code::TransportError, what + ": " + curl_easy_strerror(status));
        logger()->error("{}", error.message);
        return error;
    }
    long response_code = 0;
    status = curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code);
    if (status != CURLE_OK) [[unlikely]] {
        return Err(Error::Code::TransportError, what + ": no response code: " + curl_easy_strerror(status));
    }
    if (response_code >= 400) [[unlikely]] {
        auto error = Err(Error::Code::TransportError, what + ": HTTP status " + std::to_string(response_code));
        logger()->error("{}", error.message);
        return error;
    }
    return Ok(response_code);
}

/// @brief Bytes [first, last] of a GET answer, sliced out of a 200 full-body reply
/// @retval Error::Code::TransportError The full body ends before first
inline Result<std::vector<std::byte>> range_of_response(long response_code, std::vector<std::byte> body,
                                                         std::size_t first, std::size_t last,
                                                         const std::string& url) noexcept {
    if (response_code != 200) {
        return Ok(std::move(body));
    }
    // A server ignoring Range answers 200 with the body from byte 0
    if (first == 0 && body.size() <= last + 1) {
        return Ok(std::move(body));
    }
    if (first >= body.size()) {
        return Err(Error::Code::TransportError,
                   url + ": range start " + std::to_string(first) + " past end of " +
                   std::to_string(body.size()) + " byte body");
    }
    const std::size_t end = std::min(body.size(), last + 1);
    return Ok(std::vector<std::byte>(body.begin() + static_cast<std::ptrdiff_t>(first),
                                     body.begin() + static_cast<std::ptrdiff_t>(end)));
}

} // namespace curl_detail

inline CurlRangeFetcher::CurlRangeFetcher(std::string url, FetchOptions options)
    : url_(std::move(url)), options_(std::move(options)) {}

inline Result<std::vector<std::byte>> CurlRangeFetcher::fetch_range(std::size_t first, std::size_t last) const noexcept {
    auto handle = curl_detail::make_handle(url_, options_);
    if (!handle) {
        return handle.error();
    }
    CURL* h = handle.value().get();

    std::string range = std::to_string(first) + "-" + std::to_string(last);
    std::vector<std::byte> bytes;
    curl_detail::WriteBuffer sink{&bytes};
    CURLcode status = curl_easy_setopt(h, CURLOPT_RANGE, range.c_str());
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &curl_detail::write_callback);
    if (status == CURLE_OK) status = curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    if (status != CURLE_OK) [[unlikely]] {
        return Err(Error::Code::TransportError, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(status));
    }

    auto response = curl_detail::perform(h, "GET " + url_ + " bytes=" + range);
    if (sink.out_of_memory) [[unlikely]] {
        return Err(Error::Code::TransportError, "Out of memory while receiving bytes=" + range);
    }
    if (!response) {
        return response.error();
    }
    return curl_detail::range_of_response(response.value(), std::move(bytes), first, last, url_);
}

inline Result<std::size_t> CurlRangeFetcher::content_length() const noexcept {
    auto handle = curl_detail::make_handle(url_, options_);
    if (!handle) {
        return handle.error();
    }
    CURL* h = handle.value().get();
    CURLcode status = curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    if (status != CURLE_OK) [[unlikely]] {
        return Err(Error::Code::TransportError, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(status));
    }

    auto response = curl_detail::perform(h, "HEAD " + url_);
    if (!response) {
        return response.error();
    }
    curl_off_t length = -1;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) [[unlikely]] {
        return Err(Error::Code::TransportError, "HEAD " + url_ + ": no Content-Length in response");
    }
    return Ok(static_cast<std::size_t>(length));
}

static_assert(RangeFetcher<CurlRangeFetcher>, "CurlRangeFetcher must satisfy RangeFetcher concept");

} // namespace cogreader
