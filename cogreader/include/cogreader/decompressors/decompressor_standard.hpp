#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogreader {

/// Uncompressed tiles: the stored bytes are the samples
struct NoneDecompressor {
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        const std::size_t count = std::min(input.size(), output.size());
        if (count > 0) {
            std::memcpy(output.data(), input.data(), count);
        }
        return Ok(count);
    }
};

/// Compression 1, and 0 which some writers leave when the tag is unset
using NoneDecompressorDesc = DecompressorDescriptor<
    NoneDecompressor,
    CompressionScheme::Unspecified,
    CompressionScheme::None
>;

/**
 * @brief PackBits run-length decoding (compression code 32773)
 *
 * Each header byte h is read as signed:
 * - 0..127: the next h+1 bytes are copied
 * - -127..-1: the next byte is repeated 1-h times
 * - -128: skipped
 *
 * Decoding stops when the output is full, the last run being clipped.
 */
struct PackBitsDecompressor {
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        auto src = input.begin();
        std::size_t written = 0;

        while (src != input.end() && written < output.size()) {
            const auto header = static_cast<int8_t>(*src++);
            const std::size_t room = output.size() - written;

            if (header >= 0) {
                const auto run = static_cast<std::size_t>(header) + 1;
                if (static_cast<std::size_t>(input.end() - src) < run) [[unlikely]] {
                    return Err(Error::Code::CompressionError,
                               "PackBits literal run of " + std::to_string(run) + " bytes truncated");
                }
                std::copy_n(src, std::min(run, room), output.begin() + static_cast<std::ptrdiff_t>(written));
                src += static_cast<std::ptrdiff_t>(run);
                written += std::min(run, room);
            } else if (header != -128) {
                if (src == input.end()) [[unlikely]] {
                    return Err(Error::Code::CompressionError, "PackBits replicate run without its byte");
                }
                const auto run = static_cast<std::size_t>(1 - header);
                std::fill_n(output.begin() + static_cast<std::ptrdiff_t>(written), std::min(run, room), *src++);
                written += std::min(run, room);
            }
        }
        return Ok(written);
    }
};

using PackBitsDecompressorDesc = DecompressorDescriptor<
    PackBitsDecompressor,
    CompressionScheme::PackBits
>;

} // namespace cogreader
