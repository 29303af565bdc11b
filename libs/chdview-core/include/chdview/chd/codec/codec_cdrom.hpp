#pragma once

/**
@file
@brief CD-ROM codecs (`cdzl`, `cdlz`, `cdfl`).

CD-ROM hunks hold whole 2448-byte frames: 2352 bytes of sector data followed by 96 bytes of subcode. The codecs
compress all sector data of a hunk in one stream and all subcode in another, then interleave them back into frames.
*/

#include "codec_deflate.hpp"
#include "codec_flac.hpp"
#include "codec_lzma.hpp"

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <span>
#include <utility>
#include <vector>

namespace chdview::chd::codec {

/// @brief CD-ROM codec that compresses sector data with `TBaseCodec` and subcode with deflate.
///
/// The payload starts with a bitmap of frames whose sync header and ECC were stripped before compression, followed by
/// the compressed length of the sector data (2 bytes, or 3 bytes for hunks of 64 KiB or more).
///
/// @tparam TBaseCodec the sector data codec
template <typename TBaseCodec>
class CDCodec {
public:
    explicit CDCodec(TBaseCodec baseCodec)
        : m_baseCodec(std::move(baseCodec)) {}

    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);

private:
    TBaseCodec m_baseCodec;
    DeflateCodec m_subcodeCodec;
    std::vector<uint8> m_buffer;
};

using CDDeflateCodec = CDCodec<DeflateCodec>;
using CDLzmaCodec = CDCodec<LzmaCodec>;

/// @brief CD-ROM codec for audio tracks: sector data is FLAC-coded big-endian 16-bit stereo, subcode is deflated
/// right after the last FLAC frame.
class CDFlacCodec {
public:
    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);

private:
    FlacFrameDecoder m_decoder;
    DeflateCodec m_subcodeCodec;
    std::vector<uint8> m_buffer;
};

extern template class CDCodec<DeflateCodec>;
extern template class CDCodec<LzmaCodec>;

} // namespace chdview::chd::codec
