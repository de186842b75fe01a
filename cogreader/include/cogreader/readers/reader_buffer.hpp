#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "../reader_base.hpp"

namespace cogreader {
namespace buffer_impl {

/// Subspan of an in-memory file
class BorrowedBufferReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedBufferReadView() noexcept = default;

    explicit BorrowedBufferReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedBufferReadView(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView& operator=(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView(const BorrowedBufferReadView&) = delete;
    BorrowedBufferReadView& operator=(const BorrowedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedBufferReadView>);

/// Shared bounds handling of the in-memory readers
[[nodiscard]] inline Result<BorrowedBufferReadView> read_span(
    std::span<const std::byte> buffer, std::size_t offset, std::size_t size) noexcept {
    if (offset >= buffer.size()) [[unlikely]] {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Read offset " + std::to_string(offset) + " beyond buffer size " + std::to_string(buffer.size()));
    }
    std::size_t bytes_to_read = std::min(size, buffer.size() - offset);
    return Ok(BorrowedBufferReadView(buffer.subspan(offset, bytes_to_read)));
}

[[nodiscard]] inline Result<void> read_span_into(
    std::span<const std::byte> buffer, void* out, std::size_t offset, std::size_t size) noexcept {
    if (size == 0) {
        return Ok();
    }
    if (offset > buffer.size() || size > buffer.size() - offset) [[unlikely]] {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Cannot read " + std::to_string(size) + " bytes at offset " + std::to_string(offset) +
                   " from a buffer of " + std::to_string(buffer.size()) + " bytes");
    }
    std::memcpy(out, buffer.data() + offset, size);
    return Ok();
}

} // namespace buffer_impl

/// Reader over a file already in memory and owned by the caller
class BufferViewReader {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;
    static constexpr bool read_must_allocate = false;

    BufferViewReader() noexcept = default;

    explicit BufferViewReader(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* buffer, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span_into(buffer_, buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return true;
    }
};

static_assert(RawReader<BufferViewReader>);

/// Reader owning the bytes of a file, typically a whole COG downloaded once
class BufferReader {
private:
    std::vector<std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;
    static constexpr bool read_must_allocate = false;

    BufferReader() noexcept = default;

    explicit BufferReader(std::vector<std::byte> data) noexcept
        : buffer_(std::move(data)) {}

    explicit BufferReader(std::span<const std::byte> data)
        : buffer_(data.begin(), data.end()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* buffer, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span_into(buffer_, buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return true;
    }
};

static_assert(RawReader<BufferReader>);

} // namespace cogreader
