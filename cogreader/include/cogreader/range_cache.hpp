#pragma once

/**
 * @file range_cache.hpp
 * @brief Random-access reads over a remote immutable file through aligned, cached range fetches
 *
 * ## Chunking
 *
 * The file is split into fixed-size chunks aligned on multiples of the chunk size.
 * A read of `[offset, offset + length)` touches the chunks keyed by
 * `chunk_size * floor(position / chunk_size)`; every key missing from the table is
 * fetched once with `Range: bytes=<key>-<key + chunk_size>` and kept for the lifetime
 * of the cache. Nothing is ever evicted.
 *
 * The range end is inclusive, so each fetch asks for one byte more than a chunk.
 * Only the first chunk_size bytes of each fetch are ever served.
 *
 * ## Thread Safety
 *
 * Positioned reads (read_at(), read(offset, size), read_into(), size()) are safe to
 * call concurrently. The chunk table is guarded by a mutex; fetches run outside of
 * it, so two threads missing the same chunk may both fetch it and the first insert wins.
 *
 * The cursor used by read(buffer), seek() and tell() is not synchronized:
 * sequential access belongs to one thread.
 *
 * @code{.cpp}
 * using namespace cogreader;
 *
 * auto options = FetchOptions::from_environment().value_or(FetchOptions{});
 * RangeCache cache(CurlRangeFetcher("https://example.com/dem.tif", options), options.chunk_size);
 * auto document = read_document(cache);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>
#include "config.hpp"
#include "reader_base.hpp"
#include "types/result.hpp"

namespace cogreader {

/// Reference point of RangeCache::seek()
enum class SeekOrigin {
    Start,   ///< Relative to the first byte of the file
    Current, ///< Relative to the cursor
    End      ///< Relative to the end of the file (resolved with a size probe)
};

/// @brief Bytes copied by a read and the reason it stopped early, if any
struct ReadOutcome {
    std::size_t bytes_read = 0;
    Error error{Error::Code::Success};

    [[nodiscard]] bool complete() const noexcept { return error.is_success(); }
};

/// Read-only view owning its bytes (RangeCache reads always allocate)
class OwnedReadView {
private:
    std::vector<std::byte> data_;

public:
    OwnedReadView() noexcept = default;

    explicit OwnedReadView(std::vector<std::byte> data) noexcept
        : data_(std::move(data)) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    OwnedReadView(OwnedReadView&&) noexcept = default;
    OwnedReadView& operator=(OwnedReadView&&) noexcept = default;
    OwnedReadView(const OwnedReadView&) = delete;
    OwnedReadView& operator=(const OwnedReadView&) = delete;
};

static_assert(DataReadOnlyView<OwnedReadView>, "OwnedReadView must satisfy DataReadOnlyView concept");

/**
 * @brief Cached random-access reader over a RangeFetcher
 *
 * @tparam Fetcher Transport issuing the range and size requests
 */
template <RangeFetcher Fetcher>
class RangeCache {
private:
    using Chunk = std::shared_ptr<const std::vector<std::byte>>;

    Fetcher fetcher_;
    std::size_t chunk_size_;

    mutable std::mutex mutex_;
    mutable std::map<std::size_t, Chunk> chunks_;
    mutable std::optional<std::size_t> content_length_;

    std::size_t cursor_ = 0;

    /// Cached chunk for key, fetched on a miss
    [[nodiscard]] Result<Chunk> chunk_for(std::size_t key) const noexcept;

public:
    using ReadViewType = OwnedReadView;
    static constexpr bool read_must_allocate = true;

    /// @param fetcher Transport
    /// @param chunk_size Size of one aligned chunk; 0 selects kDefaultChunkSize
    explicit RangeCache(Fetcher fetcher, std::size_t chunk_size = kDefaultChunkSize);

    RangeCache(const RangeCache&) = delete;
    RangeCache& operator=(const RangeCache&) = delete;
    RangeCache(RangeCache&&) = delete;
    RangeCache& operator=(RangeCache&&) = delete;

    /// @brief Fill buffer with the bytes at [offset, offset + buffer.size())
    ///
    /// On a short read the bytes obtained stay in the buffer, bytes_read tells
    /// how many, and error is Error::Code::UnexpectedEndOfFile. A transport failure
    /// is reported as-is, with the bytes copied before it.
    /// The cursor is neither used nor moved.
    [[nodiscard]] ReadOutcome read_at(std::span<std::byte> buffer, std::size_t offset) const noexcept;

    /// @brief read_at() from the cursor, then advance the cursor by bytes_read
    [[nodiscard]] ReadOutcome read(std::span<std::byte> buffer) noexcept;

    /// @brief Move the cursor
    /// @return The new cursor position
    /// @retval Error::Code::OutOfBounds The target position is negative (cursor unchanged)
    /// @retval Error::Code::TransportError SeekOrigin::End needed a size probe that failed
    [[nodiscard]] Result<std::size_t> seek(int64_t offset, SeekOrigin origin) noexcept;

    [[nodiscard]] std::size_t tell() const noexcept { return cursor_; }

    // RawReader interface

    /// @brief Up to size bytes at offset; shorter at the end of the file
    /// @retval Error::Code::UnexpectedEndOfFile offset is at or past the end of the file
    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept;

    /// @brief Exactly size bytes at offset into buffer
    [[nodiscard]] Result<void> read_into(void* buffer, std::size_t offset, std::size_t size) const noexcept;

    /// @brief Total file size, probed once with a HEAD request and memoized
    [[nodiscard]] Result<std::size_t> size() const noexcept;

    /// @brief Issue a fresh HEAD request for the file size
    /// @note Usable as an existence check; also refreshes the memoized size
    [[nodiscard]] Result<std::size_t> probe_size() const noexcept;

    [[nodiscard]] bool is_valid() const noexcept { return true; }

    // Introspection

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

    [[nodiscard]] std::size_t cached_chunk_count() const noexcept;

    [[nodiscard]] const Fetcher& fetcher() const noexcept { return fetcher_; }
};

} // namespace cogreader

#define COGREADER_RANGE_CACHE_HEADER
#include "impl/range_cache_impl.hpp"
