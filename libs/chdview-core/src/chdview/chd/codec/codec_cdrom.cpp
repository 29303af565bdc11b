#include <chdview/chd/codec/codec_cdrom.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/media/cdrom_ecc.hpp>

#include <algorithm>
#include <bit>

namespace chdview::chd::codec {

using namespace media::cdrom;

// Interleaves sector data and subcode blocks back into frames
static void Reassemble(std::span<const uint8> buffer, std::span<uint8> dst, uint32 frames) {
    for (uint32 frame = 0; frame < frames; frame++) {
        std::copy_n(&buffer[frame * kSectorDataSize], kSectorDataSize, &dst[frame * kFrameSize]);
        std::copy_n(&buffer[frames * kSectorDataSize + frame * kSubcodeDataSize], kSubcodeDataSize,
                    &dst[frame * kFrameSize + kSectorDataSize]);
    }
}

template <typename TBaseCodec>
Error CDCodec<TBaseCodec>::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    if (dst.size() % kFrameSize != 0) {
        devlog::debug<grp::codec>("CD hunk size {} is not a multiple of the frame size", dst.size());
        return Error::DecompressionError;
    }

    // Determine header bytes
    const uint32 frames = static_cast<uint32>(dst.size() / kFrameSize);
    const uint32 compLenBytes = dst.size() < 65536 ? 2 : 3;
    const uint32 eccBytes = (frames + 7) / 8;
    const uint32 headerBytes = eccBytes + compLenBytes;
    if (src.size() < headerBytes) {
        return Error::DecompressionError;
    }

    // Extract compressed length of base
    uint32 compLenBase = (src[eccBytes + 0] << 8u) | src[eccBytes + 1];
    if (compLenBytes > 2) {
        compLenBase = (compLenBase << 8u) | src[eccBytes + 2];
    }
    if (compLenBase > src.size() - headerBytes) {
        return Error::DecompressionError;
    }

    m_buffer.resize(frames * (kSectorDataSize + kSubcodeDataSize));
    std::span<uint8> buffer{m_buffer};
    if (Error error = m_baseCodec.Decompress(src.subspan(headerBytes, compLenBase),
                                             buffer.first(frames * kSectorDataSize));
        error != Error::None) {
        return error;
    }
    if (Error error = m_subcodeCodec.Decompress(src.subspan(headerBytes + compLenBase),
                                                buffer.subspan(frames * kSectorDataSize));
        error != Error::None) {
        return error;
    }

    Reassemble(buffer, dst, frames);

    // Reconstitute the sync header and ECC data of flagged frames
    for (uint32 frame = 0; frame < frames; frame++) {
        if ((src[frame / 8] & (1u << (frame % 8))) != 0) {
            std::span<uint8, kSectorDataSize> sector{&dst[frame * kFrameSize], kSectorDataSize};
            std::copy(kSyncHeader.begin(), kSyncHeader.end(), sector.begin());
            GenerateECC(sector);
        }
    }
    return Error::None;
}

template class CDCodec<DeflateCodec>;
template class CDCodec<LzmaCodec>;

Error CDFlacCodec::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    if (dst.size() % kFrameSize != 0) {
        devlog::debug<grp::codec>("CD hunk size {} is not a multiple of the frame size", dst.size());
        return Error::DecompressionError;
    }
    const uint32 frames = static_cast<uint32>(dst.size() / kFrameSize);

    m_buffer.resize(frames * (kSectorDataSize + kSubcodeDataSize));
    std::span<uint8> buffer{m_buffer};
    size_t offset;
    const uint32 blockSize = FlacBlockSize(frames * kSectorDataSize, kSectorDataSize);
    if (Error error = m_decoder.DecodeInterleaved(src, blockSize, buffer.first(frames * kSectorDataSize),
                                                  std::endian::big, offset);
        error != Error::None) {
        return error;
    }
    if (Error error = m_subcodeCodec.Decompress(src.subspan(offset), buffer.subspan(frames * kSectorDataSize));
        error != Error::None) {
        return error;
    }

    Reassemble(buffer, dst, frames);
    return Error::None;
}

} // namespace chdview::chd::codec
