#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <vector>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogreader {

/**
 * @brief TIFF LZW decompression (compression code 5)
 *
 * Codes are packed MSB-first and start 9 bits wide. The width grows one code
 * early compared to GIF-style LZW ("early change"): it becomes n+1 bits as soon
 * as the next free code reaches 2^n - 1, up to 12 bits.
 * Code 256 resets the table, code 257 ends the stream.
 *
 * Strings are stored as (prefix code, last byte) pairs and written backwards,
 * the way libtiff's decoder does it.
 */
class LzwDecompressor {
private:
    static constexpr uint16_t kClear = 256;
    static constexpr uint16_t kEndOfInformation = 257;
    static constexpr uint16_t kFirstFreeCode = 258;
    static constexpr unsigned kMinBits = 9;
    static constexpr unsigned kMaxBits = 12;
    static constexpr std::size_t kTableSize = std::size_t{1} << kMaxBits;

    struct CodeEntry {
        uint16_t prefix;    ///< Previous code of the string, unused for roots
        uint16_t length;    ///< String length including this byte
        uint8_t value;      ///< Last byte of the string
        uint8_t first;      ///< First byte of the string
    };

    mutable std::vector<CodeEntry> table_;

    void reset_table() const {
        if (table_.size() != kTableSize) {
            table_.assign(kTableSize, CodeEntry{0, 0, 0, 0});
            for (uint16_t code = 0; code < 256; ++code) {
                table_[code] = CodeEntry{0, 1, static_cast<uint8_t>(code), static_cast<uint8_t>(code)};
            }
        }
    }

    /// Write the string of code at out_pos, clipped to the output size
    void emit(uint16_t code, std::span<std::byte> output, std::size_t out_pos) const noexcept {
        const CodeEntry* entry = &table_[code];
        std::size_t pos = out_pos + entry->length;
        while (true) {
            --pos;
            if (pos < output.size()) {
                output[pos] = static_cast<std::byte>(entry->value);
            }
            if (entry->length == 1) {
                break;
            }
            entry = &table_[entry->prefix];
        }
    }

public:
    LzwDecompressor() noexcept = default;

    ~LzwDecompressor() = default;

    // Non-copyable
    LzwDecompressor(const LzwDecompressor&) = delete;
    LzwDecompressor& operator=(const LzwDecompressor&) = delete;

    // Movable
    LzwDecompressor(LzwDecompressor&&) noexcept = default;
    LzwDecompressor& operator=(LzwDecompressor&&) noexcept = default;

    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        try {
            reset_table();
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::CompressionError, "LZW: cannot allocate code table");
        }

        std::size_t in_pos = 0;
        uint32_t bit_buffer = 0;
        unsigned bit_count = 0;
        unsigned code_bits = kMinBits;

        // MSB-first code reader; false once the input is exhausted
        auto next_code = [&](uint16_t& code) noexcept {
            while (bit_count < code_bits) {
                if (in_pos >= input.size()) {
                    return false;
                }
                bit_buffer = (bit_buffer << 8) | static_cast<uint8_t>(input[in_pos++]);
                bit_count += 8;
            }
            code = static_cast<uint16_t>((bit_buffer >> (bit_count - code_bits)) & ((1u << code_bits) - 1));
            bit_count -= code_bits;
            return true;
        };

        std::size_t out_pos = 0;
        uint16_t free_code = kFirstFreeCode;
        int32_t previous = -1;
        uint16_t code = 0;

        while (out_pos < output.size() && next_code(code)) {
            if (code == kEndOfInformation) {
                break;
            }

            if (code == kClear) {
                code_bits = kMinBits;
                free_code = kFirstFreeCode;
                previous = -1;
                continue;
            }

            if (previous < 0) {
                if (code >= 256) [[unlikely]] {
                    return Err(Error::Code::CompressionError,
                               "LZW: first code after a reset is " + std::to_string(code));
                }
                emit(code, output, out_pos);
                out_pos += 1;
                previous = code;
                continue;
            }

            if (free_code >= kTableSize) [[unlikely]] {
                return Err(Error::Code::CompressionError, "LZW: code table overflow");
            }

            const CodeEntry& prev_entry = table_[static_cast<uint16_t>(previous)];
            uint8_t first_byte;
            if (code < free_code) {
                first_byte = table_[code].first;
            } else if (code == free_code) {
                // KwKwK case: the string is previous + its own first byte
                first_byte = prev_entry.first;
            } else [[unlikely]] {
                return Err(Error::Code::CompressionError,
                           "LZW: corrupted code " + std::to_string(code) + " (next free code " +
                           std::to_string(free_code) + ")");
            }

            table_[free_code] = CodeEntry{
                static_cast<uint16_t>(previous),
                static_cast<uint16_t>(prev_entry.length + 1),
                first_byte,
                prev_entry.first};
            ++free_code;

            emit(code, output, out_pos);
            out_pos += table_[code].length;
            previous = code;

            if (free_code >= (1u << code_bits) - 1 && code_bits < kMaxBits) {
                ++code_bits;
            }
        }

        return Ok(std::min(out_pos, output.size()));
    }
};

/// LZW decompressor descriptor
using LzwDecompressorDesc = DecompressorDescriptor<
    LzwDecompressor,
    CompressionScheme::LZW
>;

} // namespace cogreader
