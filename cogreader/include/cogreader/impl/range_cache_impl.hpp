// Do not include this file directly. Include "cogreader/range_cache.hpp" instead.

#pragma once

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>
#include "../logging.hpp"

#ifndef COGREADER_RANGE_CACHE_HEADER
#include "../range_cache.hpp" // for linters
#endif

namespace cogreader {

template <RangeFetcher Fetcher>
RangeCache<Fetcher>::RangeCache(Fetcher fetcher, std::size_t chunk_size)
    : fetcher_(std::move(fetcher))
    , chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

template <RangeFetcher Fetcher>
Result<typename RangeCache<Fetcher>::Chunk> RangeCache<Fetcher>::chunk_for(std::size_t key) const noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chunks_.find(key);
        if (it != chunks_.end()) {
            return Ok(it->second);
        }
    }

    // Inclusive end: one byte more than a chunk is requested
    logger()->debug("Fetching bytes {}-{} of {}", key, key + chunk_size_, fetcher_.location());
    auto fetched = fetcher_.fetch_range(key, key + chunk_size_);
    if (!fetched) {
        logger()->error("Fetching bytes {}-{} failed: {}", key, key + chunk_size_, fetched.error().message);
        return fetched.error();
    }

    auto chunk = std::make_shared<const std::vector<std::byte>>(std::move(fetched).value());
    std::lock_guard<std::mutex> lock(mutex_);
    // Another thread may have stored the same chunk meanwhile; keep the first one
    auto it = chunks_.emplace(key, std::move(chunk)).first;
    return Ok(it->second);
}

template <RangeFetcher Fetcher>
ReadOutcome RangeCache<Fetcher>::read_at(std::span<std::byte> buffer, std::size_t offset) const noexcept {
    ReadOutcome outcome;
    if (buffer.empty()) {
        return outcome;
    }

    const std::size_t end = offset + buffer.size();
    const std::size_t first_key = chunk_size_ * (offset / chunk_size_);

    for (std::size_t key = first_key; key < end; key += chunk_size_) {
        auto chunk = chunk_for(key);
        if (!chunk) {
            outcome.error = chunk.error();
            return outcome;
        }
        const auto& bytes = *chunk.value();

        std::size_t slice_begin = key < offset ? offset - key : 0;
        std::size_t slice_end = std::min(end - key, chunk_size_);
        std::size_t available = std::min(slice_end, bytes.size());

        if (available > slice_begin) {
            std::memcpy(buffer.data() + outcome.bytes_read, bytes.data() + slice_begin, available - slice_begin);
            outcome.bytes_read += available - slice_begin;
        }
        // A full fetch carries chunk_size + 1 bytes; anything less means the file ends in this chunk
        bool file_ends_here = bytes.size() <= chunk_size_;
        if (available < slice_end || (file_ends_here && end > key + bytes.size())) [[unlikely]] {
            outcome.error = Err(Error::Code::UnexpectedEndOfFile,
                                "Read " + std::to_string(outcome.bytes_read) + " of " +
                                std::to_string(buffer.size()) + " bytes at offset " + std::to_string(offset) +
                                ", did you reach the end of the file?");
            return outcome;
        }
    }
    return outcome;
}

template <RangeFetcher Fetcher>
ReadOutcome RangeCache<Fetcher>::read(std::span<std::byte> buffer) noexcept {
    ReadOutcome outcome = read_at(buffer, cursor_);
    cursor_ += outcome.bytes_read;
    return outcome;
}

template <RangeFetcher Fetcher>
Result<std::size_t> RangeCache<Fetcher>::seek(int64_t offset, SeekOrigin origin) noexcept {
    int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Start:
            break;
        case SeekOrigin::Current:
            base = static_cast<int64_t>(cursor_);
            break;
        case SeekOrigin::End: {
            auto total = size();
            if (!total) {
                return total.error();
            }
            base = static_cast<int64_t>(total.value());
            break;
        }
        default:
            return Err(Error::Code::InvalidArgument, "Seek: invalid origin");
    }
    if ((offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) || base + offset < 0) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Seek: invalid offset " + std::to_string(offset));
    }
    cursor_ = static_cast<std::size_t>(base + offset);
    return Ok(cursor_);
}

template <RangeFetcher Fetcher>
Result<typename RangeCache<Fetcher>::ReadViewType> RangeCache<Fetcher>::read(
    std::size_t offset, std::size_t size) const noexcept {
    std::vector<std::byte> bytes(size);
    ReadOutcome outcome = read_at(bytes, offset);
    if (!outcome.complete()) {
        if (outcome.error.code != Error::Code::UnexpectedEndOfFile || outcome.bytes_read == 0) {
            return outcome.error;
        }
        bytes.resize(outcome.bytes_read);
    }
    return Ok(ReadViewType(std::move(bytes)));
}

template <RangeFetcher Fetcher>
Result<void> RangeCache<Fetcher>::read_into(void* buffer, std::size_t offset, std::size_t size) const noexcept {
    ReadOutcome outcome = read_at(std::span<std::byte>(static_cast<std::byte*>(buffer), size), offset);
    if (!outcome.complete()) {
        return outcome.error;
    }
    return Ok();
}

template <RangeFetcher Fetcher>
Result<std::size_t> RangeCache<Fetcher>::size() const noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (content_length_) {
            return Ok(*content_length_);
        }
    }
    return probe_size();
}

template <RangeFetcher Fetcher>
Result<std::size_t> RangeCache<Fetcher>::probe_size() const noexcept {
    logger()->debug("Getting size of {}", fetcher_.location());
    auto length = fetcher_.content_length();
    if (!length) {
        logger()->error("Size probe of {} failed: {}", fetcher_.location(), length.error().message);
        return length.error();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    content_length_ = length.value();
    return length;
}

template <RangeFetcher Fetcher>
std::size_t RangeCache<Fetcher>::cached_chunk_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace cogreader
