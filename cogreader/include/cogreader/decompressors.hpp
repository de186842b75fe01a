#pragma once

#include "decompressors/decompressor_base.hpp"
#include "decompressors/decompressor_deflate.hpp"
#include "decompressors/decompressor_lzw.hpp"
#include "decompressors/decompressor_standard.hpp"

namespace cogreader {

/// Every compression code a COG may use: none (0, 1), LZW (5), deflate (8, 32946), PackBits (32773)
using StandardDecompressors = DecompressorSpec<
    NoneDecompressorDesc,
    LzwDecompressorDesc,
    DeflateDecompressorDesc,
    PackBitsDecompressorDesc
>;

static_assert(ValidDecompressorSpec<StandardDecompressors>);

} // namespace cogreader
