#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <zlib.h>
#include "decompressor_base.hpp"
#include "../types/result.hpp"

namespace cogreader {

/// Deflate decompression (compression codes 8 and 32946) on zlib
/// The inflate stream is allocated lazily on first use and reset between tiles
class DeflateDecompressor {
private:
    /// zlib keeps a pointer back to the z_stream, so it lives on the heap
    struct InflateStream {
        z_stream zs{};
        bool initialized = false;

        ~InflateStream() {
            if (initialized) {
                inflateEnd(&zs);
            }
        }
    };

    mutable std::unique_ptr<InflateStream> stream_;

    [[nodiscard]] Result<z_stream*> ensure_stream() const noexcept {
        if (!stream_) {
            auto stream = std::make_unique<InflateStream>();
            int status = inflateInit(&stream->zs);
            if (status != Z_OK) {
                return Err(Error::Code::CompressionError,
                           "inflateInit failed with status " + std::to_string(status));
            }
            stream->initialized = true;
            stream_ = std::move(stream);
            return Ok(&stream_->zs);
        }
        int status = inflateReset(&stream_->zs);
        if (status != Z_OK) {
            return Err(Error::Code::CompressionError,
                       "inflateReset failed with status " + std::to_string(status));
        }
        return Ok(&stream_->zs);
    }

public:
    DeflateDecompressor() noexcept = default;

    ~DeflateDecompressor() = default;

    // Non-copyable
    DeflateDecompressor(const DeflateDecompressor&) = delete;
    DeflateDecompressor& operator=(const DeflateDecompressor&) = delete;

    // Movable
    DeflateDecompressor(DeflateDecompressor&&) noexcept = default;
    DeflateDecompressor& operator=(DeflateDecompressor&&) noexcept = default;

    /// Inflate a zlib stream until it ends, the input runs out or output is full
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        if (output.empty()) {
            return Ok(std::size_t{0});
        }
        if (input.size() > std::numeric_limits<uInt>::max() ||
            output.size() > std::numeric_limits<uInt>::max()) [[unlikely]] {
            return Err(Error::Code::UnsupportedFeature, "Deflate: tile larger than 4 GiB");
        }

        auto stream_result = ensure_stream();
        if (!stream_result) {
            return stream_result.error();
        }
        z_stream* stream = stream_result.value();

        stream->next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
        stream->avail_in = static_cast<uInt>(input.size());
        stream->next_out = reinterpret_cast<Bytef*>(output.data());
        stream->avail_out = static_cast<uInt>(output.size());

        while (true) {
            int status = inflate(stream, Z_NO_FLUSH);
            if (status == Z_STREAM_END) {
                break;
            }
            if (status == Z_OK) {
                if (stream->avail_out == 0) {
                    break;  // output full
                }
                continue;
            }
            if (status == Z_BUF_ERROR) {
                // No progress possible: input exhausted before the end of the stream
                break;
            }
            return Err(Error::Code::CompressionError,
                       std::string("Deflate: ") + (stream->msg ? stream->msg : "inflate failed") +
                       " (status " + std::to_string(status) + ")");
        }

        return Ok(output.size() - static_cast<std::size_t>(stream->avail_out));
    }
};

/// Deflate decompressor descriptor
/// Handles both the Adobe (8) and the legacy PKZIP (32946) codes
using DeflateDecompressorDesc = DecompressorDescriptor<
    DeflateDecompressor,
    CompressionScheme::Deflate_Adobe,
    CompressionScheme::Deflate
>;

} // namespace cogreader
