#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include "../types.hpp"
#include "../types/result.hpp"

namespace cogreader {

/**
 * @brief A tile codec
 *
 * decompress() fills at most output.size() bytes and reports how many it produced.
 * A stream ending before the output is full is not an error at this level: the tile
 * decoder turns missing samples into Error::Code::InsufficientData.
 * A corrupt stream is Error::Code::CompressionError.
 */
template<typename T>
concept DecompressorImpl = requires(const T& decompressor,
                                    std::span<std::byte> output,
                                    std::span<const std::byte> input) {
    { decompressor.decompress(output, input) } -> std::same_as<Result<std::size_t>>;
};

/// Associates a codec with the Compression tag values it decodes
template <typename DecompressorType, CompressionScheme... Schemes>
    requires DecompressorImpl<DecompressorType> && (sizeof...(Schemes) > 0)
struct DecompressorDescriptor {
    using decompressor_type = DecompressorType;
    static constexpr std::array<CompressionScheme, sizeof...(Schemes)> schemes = {Schemes...};

    static constexpr bool handles(CompressionScheme scheme) noexcept {
        return ((scheme == Schemes) || ...);
    }
};

template <typename T>
concept DecompressorDescriptorType = requires {
    typename T::decompressor_type;
    { T::schemes } -> std::convertible_to<std::span<const CompressionScheme>>;
    { T::handles(CompressionScheme::None) } -> std::same_as<bool>;
    requires DecompressorImpl<typename T::decompressor_type>;
};

namespace decompressor_detail {

/// True when no Compression value is claimed by two descriptors
template <typename... Descs>
consteval bool codes_claimed_once() {
    std::array<uint16_t, (Descs::schemes.size() + ... + 0)> codes{};
    auto out = codes.begin();
    ((out = std::transform(Descs::schemes.begin(), Descs::schemes.end(), out,
                           [](CompressionScheme s) { return static_cast<uint16_t>(s); })), ...);
    std::sort(codes.begin(), codes.end());
    return std::adjacent_find(codes.begin(), codes.end()) == codes.end();
}

} // namespace decompressor_detail

/**
 * @brief Compile-time list of the codecs a decoder instantiates
 *
 * @code{.cpp}
 * using LzwOnly = DecompressorSpec<NoneDecompressorDesc, LzwDecompressorDesc>;
 * TileDecoder<LzwOnly> decoder;  // deflate tiles now fail with UnsupportedFeature
 * @endcode
 */
template <DecompressorDescriptorType... Decompressors>
struct DecompressorSpec {
    static constexpr std::size_t num_decompressors = sizeof...(Decompressors);

    static_assert(decompressor_detail::codes_claimed_once<Decompressors...>(),
                  "A compression code is handled by more than one decompressor");

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return (Decompressors::handles(scheme) || ...);
    }
};

template <typename T>
struct is_decompressor_spec : std::false_type {};

template <typename... Descs>
struct is_decompressor_spec<DecompressorSpec<Descs...>> : std::true_type {};

template <typename T>
concept ValidDecompressorSpec = is_decompressor_spec<std::remove_cvref_t<T>>::value &&
                                (std::remove_cvref_t<T>::num_decompressors > 0);

/// One instance of every codec of a DecompressorSpec, selected by Compression value at runtime
template <typename DecompSpec>
class DecompressorStorage;

template <DecompressorDescriptorType... Descs>
class DecompressorStorage<DecompressorSpec<Descs...>> {
private:
    std::tuple<typename Descs::decompressor_type...> decompressors_;

    template <std::size_t... I>
    [[nodiscard]] std::optional<Result<std::size_t>> dispatch(
        std::span<std::byte> output,
        std::span<const std::byte> input,
        CompressionScheme scheme,
        std::index_sequence<I...>) const noexcept {

        std::optional<Result<std::size_t>> result;
        static_cast<void>(((Descs::handles(scheme) &&
                            (result.emplace(std::get<I>(decompressors_).decompress(output, input)), true)) || ...));
        return result;
    }

public:
    DecompressorStorage() = default;

    DecompressorStorage(const DecompressorStorage&) = delete;
    DecompressorStorage& operator=(const DecompressorStorage&) = delete;
    DecompressorStorage(DecompressorStorage&&) noexcept = default;
    DecompressorStorage& operator=(DecompressorStorage&&) noexcept = default;

    /// @brief Decompress input with the codec registered for scheme
    /// @return Number of bytes written to output
    /// @retval Error::Code::UnsupportedFeature No codec handles scheme
    /// @retval Error::Code::CompressionError The compressed stream is corrupt
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input,
        CompressionScheme scheme) const noexcept {

        auto result = dispatch(output, input, scheme, std::index_sequence_for<Descs...>{});
        if (!result) [[unlikely]] {
            return Err(Error::Code::UnsupportedFeature,
                       "Compression value " + std::to_string(static_cast<uint16_t>(scheme)) + " not supported");
        }
        return std::move(*result);
    }

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return (Descs::handles(scheme) || ...);
    }
};

} // namespace cogreader
