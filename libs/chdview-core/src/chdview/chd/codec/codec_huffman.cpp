#include <chdview/chd/codec/codec_huffman.hpp>

#include <chdview/chd/bit_reader.hpp>
#include <chdview/chd/huffman.hpp>

namespace chdview::chd::codec {

Error HuffmanCodec::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    BitReader reader{src};
    HuffmanDecoder decoder{256, 16};
    if (Error error = decoder.ImportTreeHuffman(reader); error != Error::None) {
        return error;
    }
    for (uint8 &b : dst) {
        uint32 symbol;
        if (Error error = decoder.Decode(reader, symbol); error != Error::None) {
            return error;
        }
        b = static_cast<uint8>(symbol);
    }
    return Error::None;
}

} // namespace chdview::chd::codec
