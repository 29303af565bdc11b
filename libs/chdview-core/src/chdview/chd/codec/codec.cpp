#include <chdview/chd/codec/codec.hpp>

#include <chdview/chd/chd_defs.hpp>

#include <chdview/media/cdrom_defs.hpp>

namespace chdview::chd::codec {

Codec MakeCodec(uint32 tag, uint32 hunkBytes) {
    switch (tag) {
    case kCodecHuffman: return HuffmanCodec{};
    case kCodecZlib: return DeflateCodec{};
    case kCodecLZMA: return LzmaCodec{hunkBytes};
    case kCodecFLAC: return FlacCodec{};
    case kCodecCDZlib: return CDDeflateCodec{DeflateCodec{}};
    case kCodecCDLZMA: {
        // The sector data stream only covers the 2352-byte portion of each frame
        const uint32 frames = hunkBytes / media::cdrom::kFrameSize;
        return CDLzmaCodec{LzmaCodec{frames * media::cdrom::kSectorDataSize}};
    }
    case kCodecCDFLAC: return CDFlacCodec{};
    default: return UnsupportedCodec{tag};
    }
}

bool IsSupported(uint32 tag) {
    switch (tag) {
    case kCodecHuffman:
    case kCodecZlib:
    case kCodecLZMA:
    case kCodecFLAC:
    case kCodecCDZlib:
    case kCodecCDLZMA:
    case kCodecCDFLAC: return true;
    default: return false;
    }
}

Error Decompress(Codec &codec, std::span<const uint8> src, std::span<uint8> dst) {
    return std::visit([&](auto &arm) { return arm.Decompress(src, dst); }, codec);
}

} // namespace chdview::chd::codec
