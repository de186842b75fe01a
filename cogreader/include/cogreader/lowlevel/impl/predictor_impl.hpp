// Do not include this file directly. Include "cogreader/lowlevel/predictor.hpp" instead.

#pragma once

#include <algorithm>
#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include "../../types.hpp"

#ifndef COGREADER_PREDICTOR_HEADER
#include "../predictor.hpp" // for linters
#endif

namespace cogreader {

namespace predictor {

template <DeltaDecodableInteger T>
void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        T* row = buffer.data() + y * stride;
        for (std::size_t x = 1; x < width; ++x) {
            row[x] = static_cast<T>(row[x] + row[x - 1]);
        }
    }
}

template <DeltaDecodableInteger T>
void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        T* row = buffer.data() + y * stride;
        // Process right to left so each difference uses the original left neighbour
        for (std::size_t x = width; x-- > 1;) {
            row[x] = static_cast<T>(row[x] - row[x - 1]);
        }
    }
}

template <std::endian SourceEndian>
Result<void> reverse_horizontal(
    std::span<std::byte> bytes,
    std::size_t width,
    std::size_t rows,
    uint16_t bits_per_sample) noexcept {

    if (width == 0) {
        return Ok();
    }

    switch (bits_per_sample) {
        case 8: {
            std::size_t complete_rows = std::min(rows, bytes.size() / width);
            auto samples = std::span<uint8_t>(reinterpret_cast<uint8_t*>(bytes.data()), bytes.size());
            delta_decode_horizontal<uint8_t>(samples, width, complete_rows, width);
            return Ok();
        }
        case 16: {
            const std::size_t row_bytes = width * 2;
            std::size_t complete_rows = std::min(rows, bytes.size() / row_bytes);
            for (std::size_t y = 0; y < complete_rows; ++y) {
                std::byte* row = bytes.data() + y * row_bytes;
                uint16_t previous = load_value<uint16_t, SourceEndian>(row);
                for (std::size_t x = 1; x < width; ++x) {
                    uint16_t current = static_cast<uint16_t>(load_value<uint16_t, SourceEndian>(row + 2 * x) + previous);
                    store_value<uint16_t, SourceEndian>(row + 2 * x, current);
                    previous = current;
                }
            }
            return Ok();
        }
        default:
            return Err(Error::Code::UnsupportedFeature,
                       "Predictor not implemented for bit-sizes other than 8 or 16 (got " +
                       std::to_string(bits_per_sample) + ")");
    }
}

} // namespace predictor

} // namespace cogreader
