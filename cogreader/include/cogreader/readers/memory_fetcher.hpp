#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../reader_base.hpp"

namespace cogreader {

/// @brief Requests observed by a MemoryRangeFetcher
struct FetchLog {
    mutable std::mutex mutex;
    std::vector<std::pair<std::size_t, std::size_t>> ranges; ///< (first, last) as requested, inclusive
    std::size_t size_probes = 0;

    [[nodiscard]] std::size_t range_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return ranges.size();
    }

    [[nodiscard]] std::size_t probe_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return size_probes;
    }

    [[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return ranges;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        ranges.clear();
        size_probes = 0;
    }
};

/// @brief RangeFetcher serving an in-memory file
///
/// Behaves like an HTTP server honoring Range requests: the end of a range is
/// clamped to the last byte, a range starting past the end fails like a 416.
/// Every request is appended to the shared FetchLog.
class MemoryRangeFetcher {
private:
    std::shared_ptr<const std::vector<std::byte>> file_;
    std::shared_ptr<FetchLog> log_;
    std::string location_;

public:
    explicit MemoryRangeFetcher(std::vector<std::byte> file, std::string location = "memory://")
        : file_(std::make_shared<const std::vector<std::byte>>(std::move(file)))
        , log_(std::make_shared<FetchLog>())
        , location_(std::move(location)) {}

    [[nodiscard]] Result<std::vector<std::byte>> fetch_range(std::size_t first, std::size_t last) const noexcept {
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            log_->ranges.emplace_back(first, last);
        }
        if (last < first) [[unlikely]] {
            return Err(Error::Code::TransportError,
                       "Invalid range bytes=" + std::to_string(first) + "-" + std::to_string(last));
        }
        if (first >= file_->size()) [[unlikely]] {
            return Err(Error::Code::TransportError,
                       location_ + ": HTTP 416 Range Not Satisfiable (bytes=" +
                       std::to_string(first) + "-" + std::to_string(last) + ")");
        }
        std::size_t end = std::min(last + 1, file_->size());
        return Ok(std::vector<std::byte>(file_->begin() + static_cast<std::ptrdiff_t>(first),
                                         file_->begin() + static_cast<std::ptrdiff_t>(end)));
    }

    [[nodiscard]] Result<std::size_t> content_length() const noexcept {
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            ++log_->size_probes;
        }
        return Ok(file_->size());
    }

    [[nodiscard]] std::string_view location() const noexcept {
        return location_;
    }

    /// @brief Request log shared by all copies of this fetcher
    [[nodiscard]] std::shared_ptr<FetchLog> log() const noexcept {
        return log_;
    }

    [[nodiscard]] std::span<const std::byte> file() const noexcept {
        return *file_;
    }
};

static_assert(RangeFetcher<MemoryRangeFetcher>, "MemoryRangeFetcher must satisfy RangeFetcher concept");

} // namespace cogreader
