#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <span>
#include <type_traits>
#include "../types/result.hpp"

namespace cogreader {

namespace predictor {

/// Concept for sample types that can be delta decoded
template <typename T>
concept DeltaDecodableInteger = std::is_same_v<T, uint8_t> ||
                                std::is_same_v<T, uint16_t> ||
                                std::is_same_v<T, int8_t> ||
                                std::is_same_v<T, int16_t>;

/// Apply horizontal differencing (TIFF predictor=2) decoding in place
///
/// Each sample from the second one onward becomes the wraparound sum of itself
/// and the already decoded sample before it in the same row. The first sample
/// of each row is left unchanged.
///
/// @tparam T Sample type
/// @param buffer Buffer containing the encoded data (modified in place)
/// @param width Number of samples per row
/// @param height Number of rows
/// @param stride Number of elements between row starts (>= width)
template <DeltaDecodableInteger T>
void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept;

/// Apply horizontal differencing (TIFF predictor=2) encoding in place
///
/// Inverse of delta_decode_horizontal(): each sample except the first of a row
/// is replaced by its difference with the previous original sample.
template <DeltaDecodableInteger T>
void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept;

/// @brief Reverse the horizontal predictor on raw tile bytes
///
/// 8-bit samples are summed byte by byte; 16-bit samples are read and written
/// as words in SourceEndian order. Only the complete rows present in bytes are
/// processed: a short tile is left for the unpacking step to report.
///
/// @tparam SourceEndian Byte order of the file
/// @param bytes Decompressed tile, row-major, width samples per row
/// @param width Tile width in samples
/// @param rows Tile height in rows
/// @param bits_per_sample 8 or 16
/// @retval Error::Code::UnsupportedFeature Any other bit depth
template <std::endian SourceEndian>
[[nodiscard]] Result<void> reverse_horizontal(
    std::span<std::byte> bytes,
    std::size_t width,
    std::size_t rows,
    uint16_t bits_per_sample) noexcept;

} // namespace predictor

} // namespace cogreader

#define COGREADER_PREDICTOR_HEADER
#include "impl/predictor_impl.hpp"
