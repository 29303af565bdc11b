#pragma once

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <span>

namespace chdview::chd::codec {

// `lzma` codec: a raw LZMA1 stream with fixed properties (lc=3, lp=0, pb=2) and no end marker.
// The dictionary size is derived from the hunk size the same way the encoder derives it.
class LzmaCodec {
public:
    explicit LzmaCodec(uint32 hunkBytes);

    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);

    uint32 DictionarySize() const {
        return m_dictSize;
    }

    // Computes the dictionary size used to compress hunks of `hunkBytes` bytes.
    static uint32 CalcDictionarySize(uint32 hunkBytes);

private:
    uint32 m_dictSize;
};

} // namespace chdview::chd::codec
