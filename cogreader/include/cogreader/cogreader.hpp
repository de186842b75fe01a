#pragma once

/// Main header for the Cloud-Optimized GeoTIFF reader library
///
/// This library decodes windows of COG files while reading only the directory
/// and the tiles a window overlaps, from memory or over HTTP range requests.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Byte sources behind the RawReader concept (in-memory buffers, RangeCache)
/// - Aligned, cached range fetches with libcurl
/// - LZW, deflate and PackBits tiles with the horizontal predictor
/// - Typed grayscale windows (UInt8, UInt16, Int8, Int16) and georeferencing summary
///
/// Example usage:
/// ```cpp
/// #include <cogreader/cogreader.hpp>
///
/// using namespace cogreader;
///
/// auto options = FetchOptions::from_environment();
/// if (!options) {
///     // Handle error
/// }
/// RangeCache cache(CurlRangeFetcher(url, options.value()), options.value().chunk_size);
///
/// auto info = decode_geo_info(cache);
/// if (info) {
///     std::cout << info.value().crs << "\n";
/// }
/// auto window = decode_level_sub_image(cache, 0, Rect{0, 0, 256, 256});
/// ```

#include "types/result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/memory_fetcher.hpp"
#include "readers/curl_fetcher.hpp"
#include "range_cache.hpp"
#include "decompressors.hpp"
#include "lowlevel/predictor.hpp"
#include "tag_directory.hpp"
#include "georeference.hpp"
#include "pixel_buffer.hpp"
#include "tile_decoder.hpp"
#include "cog_reader.hpp"
