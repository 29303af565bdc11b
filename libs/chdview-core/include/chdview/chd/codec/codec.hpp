#pragma once

/**
@file
@brief Hunk codec dispatch.

The set of codecs is closed: `Codec` is a variant over every supported codec plus `UnsupportedCodec`, which stands in
for tags the decoder does not know. Images create one `Codec` per compressor slot declared in their header.
*/

#include "codec_cdrom.hpp"
#include "codec_deflate.hpp"
#include "codec_flac.hpp"
#include "codec_huffman.hpp"
#include "codec_lzma.hpp"

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <span>
#include <variant>

namespace chdview::chd::codec {

/// @brief Placeholder for a compressor tag that is not supported. Every decompression fails with `UnknownCompressor`.
struct UnsupportedCodec {
    uint32 tag;

    Error Decompress(std::span<const uint8>, std::span<uint8>) {
        return Error::UnknownCompressor;
    }
};

using Codec = std::variant<HuffmanCodec, DeflateCodec, LzmaCodec, FlacCodec, CDDeflateCodec, CDLzmaCodec, CDFlacCodec,
                           UnsupportedCodec>;

/// @brief Creates the codec for the given compressor tag.
/// @param[in] tag the compressor tag from the header
/// @param[in] hunkBytes the image's hunk size
Codec MakeCodec(uint32 tag, uint32 hunkBytes);

/// @brief Determines if the tag names a supported codec.
bool IsSupported(uint32 tag);

/// @brief Decompresses `src` into exactly `dst.size()` bytes with the given codec.
Error Decompress(Codec &codec, std::span<const uint8> src, std::span<uint8> dst);

} // namespace chdview::chd::codec
