// Do not include this file directly. Include "cogreader/tag_directory.hpp" instead.

#pragma once

#include <algorithm>
#include <charconv>
#include <cstring>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <spdlog/fmt/ranges.h>
#include "../logging.hpp"

#ifndef COGREADER_TAG_DIRECTORY_HEADER
#include "../tag_directory.hpp" // for linters
#endif

namespace cogreader {

namespace parsing {

namespace detail {

/// Printable tag name, falling back to the numeric code
[[nodiscard]] inline std::string display_name(uint16_t code) {
    std::string_view name = tag_name(code);
    if (name.empty()) {
        return "Tag " + std::to_string(code);
    }
    return std::string(name);
}

[[nodiscard]] inline Result<void> expect_type(const DirectoryEntry& entry, TiffDataType expected) noexcept {
    if (entry.datatype != expected) [[unlikely]] {
        return Err(Error::Code::InvalidTagType,
                   display_name(entry.code) + " has type " + std::string(tiff_type_name(entry.datatype)) +
                   ", expected " + std::string(tiff_type_name(expected)));
    }
    return Ok();
}

[[nodiscard]] inline Result<void> expect_count(const DirectoryEntry& entry, uint32_t expected) noexcept {
    if (entry.count != expected) [[unlikely]] {
        return Err(Error::Code::InvalidTag,
                   display_name(entry.code) + " has count " + std::to_string(entry.count) +
                   ", expected " + std::to_string(expected));
    }
    return Ok();
}

[[nodiscard]] inline Result<void> expect_non_empty(const DirectoryEntry& entry) noexcept {
    if (entry.count == 0) [[unlikely]] {
        return Err(Error::Code::InvalidTag, display_name(entry.code) + " has no value");
    }
    return Ok();
}

/// Single SHORT or LONG value, widened to 32 bits
template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<uint32_t> read_dimension(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (auto r = expect_count(entry, 1); !r) {
        return r.error();
    }
    if (entry.datatype != TiffDataType::Short && entry.datatype != TiffDataType::Long) [[unlikely]] {
        return Err(Error::Code::InvalidTagType,
                   display_name(entry.code) + " has type " + std::string(tiff_type_name(entry.datatype)) +
                   ", expected SHORT or LONG");
    }
    auto bytes = resolve_value(reader, entry);
    if (!bytes) {
        return bytes.error();
    }
    if (entry.datatype == TiffDataType::Short) {
        return Ok(static_cast<uint32_t>(load_value<uint16_t, SourceEndian>(bytes.value().data())));
    }
    return Ok(load_value<uint32_t, SourceEndian>(bytes.value().data()));
}

/// First value of a SHORT entry (one value per sample, a single sample is supported)
template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<uint16_t> read_first_short(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (auto r = expect_type(entry, TiffDataType::Short); !r) {
        return r.error();
    }
    if (auto r = expect_non_empty(entry); !r) {
        return r.error();
    }
    auto bytes = resolve_value(reader, entry);
    if (!bytes) {
        return bytes.error();
    }
    return Ok(load_value<uint16_t, SourceEndian>(bytes.value().data()));
}

/// Single SHORT value
template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<uint16_t> read_single_short(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (auto r = expect_count(entry, 1); !r) {
        return r.error();
    }
    return read_first_short<SourceEndian>(reader, entry);
}

/// All values of an entry of the given type
template <typename T, std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<std::vector<T>> read_values(const Reader& reader, const DirectoryEntry& entry, TiffDataType expected) noexcept {
    if (auto r = expect_type(entry, expected); !r) {
        return r.error();
    }
    auto bytes = resolve_value(reader, entry);
    if (!bytes) {
        return bytes.error();
    }
    return Ok(decode_values<T, SourceEndian>(bytes.value(), entry.count));
}

/// ASCII value with its NUL padding removed
template <RawReader Reader>
[[nodiscard]] Result<std::string> read_ascii(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (auto r = expect_type(entry, TiffDataType::Ascii); !r) {
        return r.error();
    }
    auto bytes = resolve_value(reader, entry);
    if (!bytes) {
        return bytes.error();
    }
    std::string text(reinterpret_cast<const char*>(bytes.value().data()), bytes.value().size());
    auto first = text.find_first_not_of('\0');
    if (first == std::string::npos) {
        return Ok(std::string{});
    }
    auto last = text.find_last_not_of('\0');
    return Ok(text.substr(first, last - first + 1));
}

/// Decimal nodata text as written by GDAL ("-9999", "nan", "1e+30")
[[nodiscard]] inline std::optional<double> parse_nodata(std::string_view text) noexcept {
    constexpr std::string_view blanks = " \t\r\n";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    text = text.substr(first, text.find_last_not_of(blanks) - first + 1);
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// GeoKeyDirectory: header {version, revision, minor revision, key count} then key count records
template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<std::vector<GeoKeyEntry>> read_geokeys(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (auto r = expect_type(entry, TiffDataType::Short); !r) {
        return r.error();
    }
    if (entry.count < 4) [[unlikely]] {
        return Err(Error::Code::InvalidTag,
                   "GeoKeyDirectory has count " + std::to_string(entry.count) + ", expected at least 4");
    }
    auto values = read_values<uint16_t, SourceEndian>(reader, entry, TiffDataType::Short);
    if (!values) {
        return values.error();
    }
    const auto& data = values.value();
    if (data[0] != 1) [[unlikely]] {
        return Err(Error::Code::InvalidTag,
                   "GeoKeyDirectory version " + std::to_string(data[0]) + " not recognised");
    }
    const std::size_t key_count = data[3];
    if (data.size() < 4 * (key_count + 1)) [[unlikely]] {
        return Err(Error::Code::InvalidTag,
                   "GeoKeyDirectory declares " + std::to_string(key_count) + " keys but holds " +
                   std::to_string(data.size()) + " values");
    }
    std::vector<GeoKeyEntry> keys;
    keys.reserve(key_count);
    for (std::size_t i = 1; i <= key_count; ++i) {
        keys.push_back(GeoKeyEntry{data[4 * i], data[4 * i + 1], data[4 * i + 2], data[4 * i + 3]});
    }
    return Ok(std::move(keys));
}

template <std::endian SourceEndian, RawReader Reader>
[[nodiscard]] Result<GeoTiffDocument> parse_chain(const Reader& reader, const FileHeader& header) noexcept {
    GeoTiffDocument document;
    document.byte_order = header.byte_order;

    std::set<uint32_t> visited;
    uint32_t offset = header.first_ifd_offset;
    while (offset != 0) {
        if (!visited.insert(offset).second) [[unlikely]] {
            return Err(Error::Code::InvalidFormat,
                       "IFD chain loops back to offset " + std::to_string(offset));
        }
        auto next = parse_ifd<SourceEndian>(reader, offset, document);
        if (!next) {
            return next.error();
        }
        offset = next.value();
    }

    if (document.levels.empty()) [[unlikely]] {
        return Err(Error::Code::InvalidFormat, "File has no image file directory");
    }
    return Ok(std::move(document));
}

} // namespace detail

template <RawReader Reader>
Result<FileHeader> read_file_header(const Reader& reader) noexcept {
    std::array<std::byte, sizeof(TiffHeader<std::endian::little>)> raw{};
    if (auto r = reader.read_into(raw.data(), 0, raw.size()); !r) {
        return Err(r.error().code, "Failed to read TIFF header: " + r.error().message);
    }

    const char mark0 = static_cast<char>(raw[0]);
    const char mark1 = static_cast<char>(raw[1]);
    if (mark0 == 'I' && mark1 == 'I') {
        TiffHeader<std::endian::little> h;
        std::memcpy(&h, raw.data(), sizeof(h));
        if (!h.is_valid()) [[unlikely]] {
            return Err(Error::Code::InvalidHeader, "Not a classic TIFF file: version is not 42");
        }
        return Ok(FileHeader{ByteOrder::LittleEndian, h.get_first_ifd_offset()});
    }
    if (mark0 == 'M' && mark1 == 'M') {
        TiffHeader<std::endian::big> h;
        std::memcpy(&h, raw.data(), sizeof(h));
        if (!h.is_valid()) [[unlikely]] {
            return Err(Error::Code::InvalidHeader, "Not a classic TIFF file: version is not 42");
        }
        return Ok(FileHeader{ByteOrder::BigEndian, h.get_first_ifd_offset()});
    }
    return Err(Error::Code::InvalidHeader, "Invalid byte order mark, expected \"II\" or \"MM\"");
}

template <std::endian SourceEndian>
DirectoryEntry decode_entry(const TiffTag<SourceEndian>& tag) noexcept {
    DirectoryEntry entry;
    entry.code = tag.get_code();
    entry.datatype = tag.get_datatype();
    entry.count = tag.get_count();
    if (tag.is_inline()) {
        entry.location = InlineValue{tag.value.raw, tag.data_size()};
    } else {
        entry.location = OutOfLineValue{tag.get_offset(), tag.data_size()};
    }
    return entry;
}

template <RawReader Reader>
Result<std::vector<std::byte>> resolve_value(const Reader& reader, const DirectoryEntry& entry) noexcept {
    if (const auto* inline_value = std::get_if<InlineValue>(&entry.location)) {
        return Ok(std::vector<std::byte>(inline_value->bytes.begin(),
                                         inline_value->bytes.begin() + inline_value->size));
    }

    const auto& external = std::get<OutOfLineValue>(entry.location);
    if (external.size > kMaxTagValueBytes) [[unlikely]] {
        return Err(Error::Code::InvalidTag,
                   detail::display_name(entry.code) + " value of " + std::to_string(external.size) +
                   " bytes is too large");
    }
    std::vector<std::byte> bytes(external.size);
    if (auto r = reader.read_into(bytes.data(), external.offset, bytes.size()); !r) {
        return Err(r.error().code,
                   "Failed to read " + detail::display_name(entry.code) + " value at offset " +
                   std::to_string(external.offset) + ": " + r.error().message);
    }
    return Ok(std::move(bytes));
}

template <typename T, std::endian SourceEndian>
std::vector<T> decode_values(std::span<const std::byte> bytes, std::size_t count) {
    std::vector<T> values(count);
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = load_value<T, SourceEndian>(bytes.data() + i * sizeof(T));
    }
    return values;
}

template <std::endian SourceEndian, RawReader Reader>
Result<uint32_t> parse_ifd(const Reader& reader, uint32_t offset, GeoTiffDocument& document) noexcept {
    std::array<std::byte, 4> word{};
    if (auto r = reader.read_into(word.data(), offset, 2); !r) {
        return Err(r.error().code, "Failed to read IFD at offset " + std::to_string(offset) + ": " + r.error().message);
    }
    const std::size_t entry_count = load_value<uint16_t, SourceEndian>(word.data());

    std::vector<TiffTag<SourceEndian>> tags(entry_count);
    if (entry_count > 0) {
        if (auto r = reader.read_into(tags.data(), std::size_t{offset} + 2, entry_count * sizeof(TiffTag<SourceEndian>)); !r) {
            return Err(r.error().code,
                       "Failed to read the " + std::to_string(entry_count) + " entries of IFD at offset " +
                       std::to_string(offset) + ": " + r.error().message);
        }
    }

    const std::size_t next_position = std::size_t{offset} + 2 + entry_count * sizeof(TiffTag<SourceEndian>);
    if (auto r = reader.read_into(word.data(), next_position, 4); !r) {
        return Err(r.error().code,
                   "Failed to read next IFD offset at " + std::to_string(next_position) + ": " + r.error().message);
    }
    const uint32_t next_offset = load_value<uint32_t, SourceEndian>(word.data());

    const bool first_ifd = document.levels.empty();
    RasterLevel level;
    std::optional<std::vector<double>> pixel_scale;
    std::optional<std::vector<double>> tiepoint;

    for (const auto& tag : tags) {
        const DirectoryEntry entry = decode_entry(tag);
        const auto code = static_cast<TagCode>(entry.code);

        switch (code) {
            case TagCode::ModelPixelScale:
            case TagCode::ModelTiepoint:
            case TagCode::GeoKeyDirectory:
            case TagCode::GeoDoubleParams:
            case TagCode::GeoAsciiParams:
            case TagCode::GDALMetadata:
            case TagCode::GDALNoData:
                if (!first_ifd) {
                    logger()->debug("IFD at offset {}: ignoring {} outside of the first directory",
                                    offset, tag_name(entry.code));
                    continue;
                }
                break;
            default:
                break;
        }

        switch (code) {
            case TagCode::NewSubfileType: {
                if (auto r = detail::expect_type(entry, TiffDataType::Long); !r) return r.error();
                if (auto r = detail::expect_count(entry, 1); !r) return r.error();
                auto bytes = resolve_value(reader, entry);
                if (!bytes) return bytes.error();
                level.new_subfile_type = load_value<uint32_t, SourceEndian>(bytes.value().data());
                break;
            }
            case TagCode::ImageWidth: {
                auto value = detail::read_dimension<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.width = value.value();
                break;
            }
            case TagCode::ImageLength: {
                auto value = detail::read_dimension<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.height = value.value();
                break;
            }
            case TagCode::TileWidth: {
                auto value = detail::read_dimension<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.tile_width = value.value();
                break;
            }
            case TagCode::TileLength: {
                auto value = detail::read_dimension<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.tile_height = value.value();
                break;
            }
            case TagCode::BitsPerSample: {
                auto value = detail::read_first_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.bits_per_sample = value.value();
                break;
            }
            case TagCode::Compression: {
                auto value = detail::read_single_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.compression = static_cast<CompressionScheme>(value.value());
                break;
            }
            case TagCode::PhotometricInterpretation: {
                auto value = detail::read_single_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.photometric = static_cast<PhotometricInterpretation>(value.value());
                break;
            }
            case TagCode::SamplesPerPixel: {
                auto value = detail::read_single_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.samples_per_pixel = value.value();
                break;
            }
            case TagCode::PlanarConfiguration: {
                auto value = detail::read_first_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                if (value.value() != static_cast<uint16_t>(PlanarConfiguration::Chunky)) [[unlikely]] {
                    return Err(Error::Code::UnsupportedFeature,
                               "Planar configuration other than chunky is not implemented: " +
                               std::to_string(value.value()));
                }
                break;
            }
            case TagCode::SampleFormat: {
                auto value = detail::read_first_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                level.sample_format = static_cast<SampleFormat>(value.value());
                break;
            }
            case TagCode::Predictor: {
                auto value = detail::read_first_short<SourceEndian>(reader, entry);
                if (!value) return value.error();
                if (value.value() != static_cast<uint16_t>(Predictor::None) &&
                    value.value() != static_cast<uint16_t>(Predictor::Horizontal)) [[unlikely]] {
                    return Err(Error::Code::UnsupportedFeature,
                               "Predictor other than 1 (none) or 2 (horizontal) is not implemented: " +
                               std::to_string(value.value()));
                }
                level.predictor = static_cast<Predictor>(value.value());
                break;
            }
            case TagCode::TileOffsets: {
                auto values = detail::read_values<uint32_t, SourceEndian>(reader, entry, TiffDataType::Long);
                if (!values) return values.error();
                level.tile_offsets = std::move(values).value();
                break;
            }
            case TagCode::TileByteCounts: {
                auto values = detail::read_values<uint32_t, SourceEndian>(reader, entry, TiffDataType::Long);
                if (!values) return values.error();
                level.tile_byte_counts = std::move(values).value();
                break;
            }
            case TagCode::GeoDoubleParams: {
                auto values = detail::read_values<double, SourceEndian>(reader, entry, TiffDataType::Double);
                if (!values) return values.error();
                document.geo_double_params = std::move(values).value();
                break;
            }
            case TagCode::GeoAsciiParams: {
                auto text = detail::read_ascii(reader, entry);
                if (!text) return text.error();
                document.geo_ascii_params = std::move(text).value();
                break;
            }
            case TagCode::GeoKeyDirectory: {
                auto keys = detail::read_geokeys<SourceEndian>(reader, entry);
                if (!keys) return keys.error();
                document.geokeys = std::move(keys).value();
                break;
            }
            case TagCode::ModelPixelScale: {
                if (auto r = detail::expect_type(entry, TiffDataType::Double); !r) return r.error();
                if (auto r = detail::expect_count(entry, 3); !r) return r.error();
                auto values = detail::read_values<double, SourceEndian>(reader, entry, TiffDataType::Double);
                if (!values) return values.error();
                pixel_scale = std::move(values).value();
                break;
            }
            case TagCode::ModelTiepoint: {
                if (auto r = detail::expect_type(entry, TiffDataType::Double); !r) return r.error();
                if (entry.count < 6) [[unlikely]] {
                    return Err(Error::Code::InvalidTag,
                               "ModelTiepoint has count " + std::to_string(entry.count) + ", expected at least 6");
                }
                auto values = detail::read_values<double, SourceEndian>(reader, entry, TiffDataType::Double);
                if (!values) return values.error();
                tiepoint = std::move(values).value();
                break;
            }
            case TagCode::ModelTransformation:
                return Err(Error::Code::UnsupportedFeature,
                           "ModelTransformation georeferencing is not implemented");
            case TagCode::GDALNoData: {
                auto text = detail::read_ascii(reader, entry);
                if (!text) return text.error();
                document.nodata = detail::parse_nodata(text.value());
                if (!document.nodata) {
                    logger()->warn("GDAL nodata value '{}' cannot be parsed, using 0", text.value());
                    document.nodata = 0.0;
                }
                break;
            }
            case TagCode::GDALMetadata: {
                auto text = detail::read_ascii(reader, entry);
                if (!text) return text.error();
                document.gdal_metadata = std::move(text).value();
                break;
            }
            default:
                level.unrecognized_tags.push_back(entry.code);
                break;
        }
    }

    if (!level.unrecognized_tags.empty()) {
        logger()->debug("IFD at offset {}: unrecognized tags {}", offset, fmt::join(level.unrecognized_tags, ", "));
    }

    if (first_ifd) {
        if (tiepoint) {
            document.geotransform[0] = (*tiepoint)[3];
            document.geotransform[3] = (*tiepoint)[4];
        }
        if (pixel_scale) {
            document.geotransform[1] = (*pixel_scale)[0];
            document.geotransform[5] = -(*pixel_scale)[1];
        }
    }

    document.levels.push_back(std::move(level));
    return Ok(next_offset);
}

template <RawReader Reader>
Result<GeoTiffDocument> parse_document(const Reader& reader) noexcept {
    auto header = read_file_header(reader);
    if (!header) {
        return header.error();
    }
    if (header.value().byte_order == ByteOrder::LittleEndian) {
        return detail::parse_chain<std::endian::little>(reader, header.value());
    }
    return detail::parse_chain<std::endian::big>(reader, header.value());
}

} // namespace parsing

} // namespace cogreader
