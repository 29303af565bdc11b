#pragma once

#include <chdview/chd/chd_error.hpp>

#include <chdview/core/types.hpp>

#include <span>

namespace chdview::chd::codec {

// `zlib` codec: a raw deflate stream (no zlib header or trailer) that must expand to exactly the output size.
class DeflateCodec {
public:
    Error Decompress(std::span<const uint8> src, std::span<uint8> dst);
};

} // namespace chdview::chd::codec
