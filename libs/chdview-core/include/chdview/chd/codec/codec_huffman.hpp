#pragma once

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <span>

namespace chdview::chd::codec {

// `huff` codec: a Huffman-coded code length table for the 256 byte values followed by the coded bytes.
class HuffmanCodec {
public:
    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);
};

} // namespace chdview::chd::codec
