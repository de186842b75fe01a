#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>
#include "types/result.hpp"

namespace cogreader {

/// Bytes returned by RawReader::read(), owned or borrowed
/// A view is used by one thread at a time
template <typename T>
concept DataReadOnlyView = requires(T view) {
    // Contiguous bytes, possibly fewer than requested near the end of the source
    { view.data() } -> std::same_as<std::span<const std::byte>>;

    { view.size() } -> std::same_as<std::size_t>;

    { view.empty() } -> std::same_as<bool>;

    // Stored in Result<T>
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Positioned, thread-safe access to the bytes of a COG
///
/// Both the directory parser and the tile decoder are written against this
/// concept, so a local buffer and a remote file are interchangeable.
template <typename T>
concept RawReader = requires(const T reader, void* buffer, std::size_t offset, std::size_t size) {
    // View of [offset, offset + size), shorter when the source ends first.
    // Safe to call from several threads.
    { reader.read(offset, size) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Read exactly size bytes into the provided buffer, or fail
    { reader.read_into(buffer, offset, size) } -> std::same_as<Result<void>>;

    // Total length in bytes; remote readers may need a round trip
    { reader.size() } -> std::same_as<Result<std::size_t>>;

    { reader.is_valid() } -> std::same_as<bool>;

    // True when read() copies, in which case callers holding a buffer use read_into()
    { T::read_must_allocate } -> std::convertible_to<bool>;
};

/// Concept for the transport under RangeCache
///
/// Ranges follow HTTP semantics: both ends are inclusive, an end past the last
/// byte is clamped, a start past the last byte is an error.
template <typename T>
concept RangeFetcher = requires(const T fetcher, std::size_t first, std::size_t last) {
    { fetcher.fetch_range(first, last) } -> std::same_as<Result<std::vector<std::byte>>>;

    // Metadata-only request (HEAD) for the total content length
    { fetcher.content_length() } -> std::same_as<Result<std::size_t>>;

    // Human readable location, used in diagnostics
    { fetcher.location() } -> std::convertible_to<std::string_view>;
};

} // namespace cogreader
