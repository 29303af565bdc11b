#include "chd_test_utils.hpp"

#include <chdview/chd/crc16.hpp>

#include <chdview/util/data_ops.hpp>
#include <chdview/util/scope_guard.hpp>

#include <FLAC/stream_encoder.h>

#include <lzma.h>
#include <zlib.h>

#include <algorithm>
#include <bit>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace chd_test {

// -----------------------------------------------------------------------------
// BitWriter

void BitWriter::Write(uint32 value, uint32 numBits) {
    for (uint32 i = numBits; i > 0; i--) {
        const uint32 bit = (value >> (i - 1)) & 1;
        if (m_bitPos / 8 >= m_data.size()) {
            m_data.push_back(0);
        }
        m_data[m_bitPos / 8] |= static_cast<uint8>(bit << (7 - m_bitPos % 8));
        m_bitPos++;
    }
}

void BitWriter::AlignToByte() {
    m_bitPos = (m_bitPos + 7) & ~uint64(7);
    m_data.resize(m_bitPos / 8);
}

// -----------------------------------------------------------------------------
// Data generators

std::vector<uint8> MakeNoise(size_t size, uint32 seed) {
    std::vector<uint8> data(size);
    uint32 state = seed * 2654435761u + 1;
    for (uint8 &b : data) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        b = static_cast<uint8>(state >> 24);
    }
    return data;
}

std::vector<uint8> MakeText(size_t size, uint32 seed) {
    static constexpr std::string_view kWords[] = {"hunk ", "map ", "parent ", "codec ", "self ", "cache ", "sector "};
    std::vector<uint8> data;
    data.reserve(size);
    uint32 state = seed;
    while (data.size() < size) {
        state = state * 1103515245u + 12345u;
        const std::string_view word = kWords[(state >> 16) % std::size(kWords)];
        for (char ch : word) {
            if (data.size() < size) {
                data.push_back(static_cast<uint8>(ch));
            }
        }
    }
    return data;
}

// -----------------------------------------------------------------------------
// Compressors

std::vector<uint8> Deflate(std::span<const uint8> data) {
    z_stream z{};
    if (deflateInit2(&z, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::vector<uint8> out(deflateBound(&z, static_cast<uLong>(data.size())));
    z.next_in = const_cast<Bytef *>(data.data());
    z.avail_in = static_cast<uInt>(data.size());
    z.next_out = out.data();
    z.avail_out = static_cast<uInt>(out.size());
    const int status = deflate(&z, Z_FINISH);
    const uLong total = z.total_out;
    deflateEnd(&z);
    if (status != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(total);
    return out;
}

std::vector<uint8> CompressLZMA(std::span<const uint8> data, uint32 dictSize) {
    lzma_options_lzma options{};
    if (lzma_lzma_preset(&options, 6)) {
        throw std::runtime_error("lzma_lzma_preset failed");
    }
    options.dict_size = dictSize;
    options.lc = 3;
    options.lp = 0;
    options.pb = 2;

    lzma_filter filters[2] = {{LZMA_FILTER_LZMA1, &options}, {LZMA_VLI_UNKNOWN, nullptr}};
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_raw_encoder(&strm, filters) != LZMA_OK) {
        throw std::runtime_error("lzma_raw_encoder failed");
    }

    std::vector<uint8> out(data.size() + data.size() / 2 + 1024);
    strm.next_in = data.data();
    strm.avail_in = data.size();
    strm.next_out = out.data();
    strm.avail_out = out.size();
    const lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
    const uint64 total = strm.total_out;
    lzma_end(&strm);
    if (ret != LZMA_STREAM_END) {
        throw std::runtime_error("lzma_code failed");
    }
    out.resize(total);
    return out;
}

std::vector<uint8> EncodeHuffman(std::span<const uint8> data) {
    BitWriter bw;

    // Small tree: symbol 0 (repeat) and symbol 9 (length 8) both get 1-bit codes
    bw.Write(1, 3); // length of symbol 0
    bw.Write(7, 3); // lengths start at index 8
    bw.Write(0, 3); // symbol 8
    bw.Write(1, 3); // symbol 9
    bw.Write(7, 3); // end of lengths

    // Code lengths: 8 for the first symbol, then a long run of the same length for the remaining 255
    bw.Write(1, 1);
    bw.Write(0, 1);
    bw.Write(7, 3);
    bw.Write(255 - 9, 8);

    // With every code 8 bits long, symbol N is coded as N
    for (uint8 b : data) {
        bw.Write(b, 8);
    }
    bw.AlignToByte();
    return bw.Data();
}

// -----------------------------------------------------------------------------
// FLAC

static FLAC__StreamEncoderWriteStatus CollectFrames(const FLAC__StreamEncoder *, const FLAC__byte buffer[],
                                                    size_t bytes, uint32_t samples, uint32_t, void *clientData) {
    // The stream marker and metadata blocks are written with no samples; CHD only stores frames
    if (samples != 0) {
        auto &out = *static_cast<std::vector<uint8> *>(clientData);
        out.insert(out.end(), buffer, buffer + bytes);
    }
    return FLAC__STREAM_ENCODER_WRITE_STATUS_OK;
}

std::vector<uint8> EncodeFlacStereo(std::span<const sint16> interleaved, uint32 blockSize) {
    FLAC__StreamEncoder *encoder = FLAC__stream_encoder_new();
    if (encoder == nullptr) {
        throw std::runtime_error("FLAC__stream_encoder_new failed");
    }
    util::ScopeGuard sgDeleteEncoder{[&] { FLAC__stream_encoder_delete(encoder); }};

    const bool configured = FLAC__stream_encoder_set_compression_level(encoder, 8) &&
                            FLAC__stream_encoder_set_channels(encoder, 2) &&
                            FLAC__stream_encoder_set_bits_per_sample(encoder, 16) &&
                            FLAC__stream_encoder_set_sample_rate(encoder, 44100) &&
                            FLAC__stream_encoder_set_streamable_subset(encoder, false) &&
                            FLAC__stream_encoder_set_blocksize(encoder, blockSize);
    if (!configured) {
        throw std::runtime_error("FLAC encoder configuration failed");
    }

    std::vector<uint8> out;
    if (FLAC__stream_encoder_init_stream(encoder, CollectFrames, nullptr, nullptr, nullptr, &out) !=
        FLAC__STREAM_ENCODER_INIT_STATUS_OK) {
        throw std::runtime_error("FLAC__stream_encoder_init_stream failed");
    }

    const std::vector<FLAC__int32> samples(interleaved.begin(), interleaved.end());
    const bool encoded = FLAC__stream_encoder_process_interleaved(encoder, samples.data(),
                                                                  static_cast<uint32_t>(samples.size() / 2));
    if (!FLAC__stream_encoder_finish(encoder) || !encoded) {
        throw std::runtime_error("FLAC encoding failed");
    }
    return out;
}

// -----------------------------------------------------------------------------
// Compressed map

static uint32 BaseType(chd::HunkKind kind) {
    switch (kind) {
    case chd::HunkKind::Codec0: return chd::compression::kType0;
    case chd::HunkKind::Codec1: return chd::compression::kType1;
    case chd::HunkKind::Codec2: return chd::compression::kType2;
    case chd::HunkKind::Codec3: return chd::compression::kType3;
    case chd::HunkKind::Uncompressed: return chd::compression::kNone;
    case chd::HunkKind::Self: return chd::compression::kSelf;
    case chd::HunkKind::Parent: return chd::compression::kParent;
    default: throw std::invalid_argument("hunk kind cannot be stored in a compressed map");
    }
}

std::vector<uint8> EncodeCompressedMap(std::span<const chd::MapEntry> entries, uint32 hunkBytes, uint64 firstOffset,
                                       bool useRLE) {
    const size_t count = entries.size();
    std::vector<uint32> types(count);
    uint32 maxLength = 0;
    uint64 maxSelf = 0;
    uint64 maxParent = 0;
    for (size_t i = 0; i < count; i++) {
        types[i] = BaseType(entries[i].kind);
        if (entries[i].IsCodec()) {
            maxLength = std::max(maxLength, entries[i].length);
        } else if (entries[i].kind == chd::HunkKind::Self) {
            maxSelf = std::max(maxSelf, entries[i].offset);
        } else if (entries[i].kind == chd::HunkKind::Parent) {
            maxParent = std::max(maxParent, entries[i].offset);
        }
    }
    const uint8 lengthBits = static_cast<uint8>(std::bit_width(maxLength));
    const uint8 selfBits = static_cast<uint8>(std::bit_width(maxSelf));
    const uint8 parentBits = static_cast<uint8>(std::bit_width(maxParent));

    BitWriter bw;

    // Type tree: all 16 symbols get 4-bit codes, stored as a single repeat
    bw.Write(1, 4);
    bw.Write(4, 4);
    bw.Write(16 - 3, 4);

    for (size_t i = 0; i < count;) {
        const uint32 type = types[i];
        bw.Write(type, 4);
        i++;
        if (!useRLE) {
            continue;
        }
        size_t run = 0;
        while (i + run < count && types[i + run] == type) {
            run++;
        }
        size_t remaining = run;
        while (remaining >= 3) {
            if (remaining >= 19) {
                const size_t extra = std::min<size_t>(remaining - 19, 255);
                bw.Write(chd::compression::kRLELarge, 4);
                bw.Write(static_cast<uint32>(extra >> 4), 4);
                bw.Write(static_cast<uint32>(extra & 15), 4);
                remaining -= 19 + extra;
            } else {
                const size_t extra = std::min<size_t>(remaining - 3, 15);
                bw.Write(chd::compression::kRLESmall, 4);
                bw.Write(static_cast<uint32>(extra), 4);
                remaining -= 3 + extra;
            }
        }
        i += run - remaining;
    }

    std::vector<uint8> rawMap(count * chd::kMapEntrySize);
    uint64 curOffset = firstOffset;
    for (size_t i = 0; i < count; i++) {
        const chd::MapEntry &entry = entries[i];
        uint32 length = 0;
        uint64 offset = 0;
        uint16 crc = 0;
        if (entry.IsCodec()) {
            length = entry.length;
            offset = curOffset;
            crc = entry.crc;
            bw.Write(length, lengthBits);
            bw.Write(crc, 16);
            curOffset += length;
        } else if (entry.kind == chd::HunkKind::Uncompressed) {
            length = hunkBytes;
            offset = curOffset;
            crc = entry.crc;
            bw.Write(crc, 16);
            curOffset += length;
        } else if (entry.kind == chd::HunkKind::Self) {
            offset = entry.offset;
            bw.Write(static_cast<uint32>(offset), selfBits);
        } else {
            offset = entry.offset;
            bw.Write(static_cast<uint32>(offset), parentBits);
        }

        uint8 *raw = &rawMap[i * chd::kMapEntrySize];
        raw[0] = static_cast<uint8>(types[i]);
        util::WriteBEN(&raw[1], length, 3);
        util::WriteBEN(&raw[4], offset, 6);
        util::WriteBE<uint16>(&raw[10], crc);
    }
    bw.AlignToByte();

    std::vector<uint8> out(chd::kMapHeaderSize);
    util::WriteBE<uint32>(&out[0], static_cast<uint32>(bw.Data().size()));
    util::WriteBEN(&out[4], firstOffset, 6);
    util::WriteBE<uint16>(&out[10], chd::CalcCRC16(rawMap));
    out[12] = lengthBits;
    out[13] = selfBits;
    out[14] = parentBits;
    out[15] = 0;
    out.insert(out.end(), bw.Data().begin(), bw.Data().end());
    return out;
}

// -----------------------------------------------------------------------------
// ImageBuilder

ImageBuilder::ImageBuilder(uint32 hunkBytes, uint64 logicalBytes, uint32 unitBytes) {
    header.hunkBytes = hunkBytes;
    header.logicalBytes = logicalBytes;
    header.unitBytes = unitBytes;
    header.hunkCount = static_cast<uint32>((logicalBytes + hunkBytes - 1) / hunkBytes);
}

ImageBuilder &ImageBuilder::AddCodecHunk(uint32 slot, std::vector<uint8> payload, std::span<const uint8> decoded) {
    const auto kind = static_cast<chd::HunkKind>(static_cast<uint32>(chd::HunkKind::Codec0) + slot);
    m_hunks.push_back({kind, std::move(payload), chd::CalcCRC16(decoded)});
    return *this;
}

ImageBuilder &ImageBuilder::AddRawHunk(std::span<const uint8> decoded) {
    return AddRawHunkWithCRC(decoded, chd::CalcCRC16(decoded));
}

ImageBuilder &ImageBuilder::AddRawHunkWithCRC(std::span<const uint8> decoded, uint16 crc) {
    m_hunks.push_back({chd::HunkKind::Uncompressed, {decoded.begin(), decoded.end()}, crc});
    return *this;
}

ImageBuilder &ImageBuilder::AddSelfHunk(uint32 target) {
    m_hunks.push_back({chd::HunkKind::Self, {}, 0, target});
    return *this;
}

ImageBuilder &ImageBuilder::AddParentHunk(uint64 unitOffset) {
    m_hunks.push_back({chd::HunkKind::Parent, {}, 0, unitOffset});
    return *this;
}

ImageBuilder &ImageBuilder::AddZeroHunk() {
    m_hunks.push_back({chd::HunkKind::Mini, {}, 0});
    return *this;
}

ImageBuilder &ImageBuilder::AddMetadata(uint32 tag, uint8 flags, std::span<const uint8> data) {
    m_metadata.push_back({tag, flags, {data.begin(), data.end()}});
    return *this;
}

void ImageBuilder::WriteHeader(std::vector<uint8> &out, uint64 mapOffset, uint64 metaOffset) const {
    uint8 *hdr = out.data();
    std::copy(chd::kMagic.begin(), chd::kMagic.end(), &hdr[chd::hdr::kMagicOffset]);
    util::WriteBE<uint32>(&hdr[chd::hdr::kLengthOffset], header.length);
    util::WriteBE<uint32>(&hdr[chd::hdr::kVersionOffset], header.version);
    for (uint32 i = 0; i < chd::kNumCompressors; i++) {
        util::WriteBE<uint32>(&hdr[chd::hdr::kCompressorsOffset + i * 4], header.compressors[i]);
    }
    util::WriteBE<uint64>(&hdr[chd::hdr::kLogicalBytesOffset], header.logicalBytes);
    util::WriteBE<uint64>(&hdr[chd::hdr::kMapOffsetOffset], mapOffset);
    util::WriteBE<uint64>(&hdr[chd::hdr::kMetaOffsetOffset], metaOffset);
    util::WriteBE<uint32>(&hdr[chd::hdr::kHunkBytesOffset], header.hunkBytes);
    util::WriteBE<uint32>(&hdr[chd::hdr::kUnitBytesOffset], header.unitBytes);
    std::copy(header.rawSHA1.begin(), header.rawSHA1.end(), &hdr[chd::hdr::kRawSHA1Offset]);
    std::copy(header.sha1.begin(), header.sha1.end(), &hdr[chd::hdr::kSHA1Offset]);
    std::copy(header.parentSHA1.begin(), header.parentSHA1.end(), &hdr[chd::hdr::kParentSHA1Offset]);
}

void ImageBuilder::WriteMetadata(std::vector<uint8> &out, uint64 &metaOffset) const {
    metaOffset = m_metadata.empty() ? 0 : out.size();
    for (size_t i = 0; i < m_metadata.size(); i++) {
        const Metadata &meta = m_metadata[i];
        const size_t entryOffset = out.size();
        const uint64 next = i + 1 < m_metadata.size() ? entryOffset + chd::kMetadataHeaderSize + meta.data.size() : 0;
        out.resize(entryOffset + chd::kMetadataHeaderSize);
        util::WriteBE<uint32>(&out[entryOffset + 0], meta.tag);
        out[entryOffset + 4] = meta.flags;
        util::WriteBEN(&out[entryOffset + 5], meta.data.size(), 3);
        util::WriteBE<uint64>(&out[entryOffset + 8], next);
        out.insert(out.end(), meta.data.begin(), meta.data.end());
    }
}

ImageBuilder::Output ImageBuilder::BuildCompressed() const {
    Output output{};
    std::vector<uint8> &out = output.bytes;
    out.resize(chd::kHeaderSize);

    std::vector<chd::MapEntry> entries;
    for (const Hunk &hunk : m_hunks) {
        chd::MapEntry &entry = entries.emplace_back();
        entry.kind = hunk.kind;
        entry.length = static_cast<uint32>(hunk.payload.size());
        entry.crc = hunk.crc;
        entry.offset = hunk.reference;
        output.dataOffsets.push_back(hunk.payload.empty() ? 0 : out.size());
        out.insert(out.end(), hunk.payload.begin(), hunk.payload.end());
    }

    output.mapOffset = out.size();
    const std::vector<uint8> map = EncodeCompressedMap(entries, header.hunkBytes, chd::kHeaderSize, useRLE);
    out.insert(out.end(), map.begin(), map.end());

    uint64 metaOffset;
    WriteMetadata(out, metaOffset);
    WriteHeader(out, output.mapOffset, metaOffset);
    return output;
}

ImageBuilder::Output ImageBuilder::BuildUncompressed() const {
    Output output{};
    std::vector<uint8> &out = output.bytes;
    output.mapOffset = chd::kHeaderSize;
    out.resize(chd::kHeaderSize + m_hunks.size() * chd::kUncompressedMapEntrySize);
    out.resize((out.size() + header.hunkBytes - 1) / header.hunkBytes * header.hunkBytes);

    for (size_t i = 0; i < m_hunks.size(); i++) {
        const Hunk &hunk = m_hunks[i];
        if (hunk.kind != chd::HunkKind::Uncompressed) {
            output.dataOffsets.push_back(0);
            continue;
        }
        const uint64 offset = out.size();
        output.dataOffsets.push_back(offset);
        util::WriteBE<uint32>(&out[output.mapOffset + i * chd::kUncompressedMapEntrySize],
                              static_cast<uint32>(offset / header.hunkBytes));
        out.insert(out.end(), hunk.payload.begin(), hunk.payload.end());
        out.resize(offset + header.hunkBytes);
    }

    uint64 metaOffset;
    WriteMetadata(out, metaOffset);
    WriteHeader(out, output.mapOffset, metaOffset);
    return output;
}

ImageBuilder::Output ImageBuilder::Build() const {
    return header.compressors[0] != chd::kCodecNone ? BuildCompressed() : BuildUncompressed();
}

} // namespace chd_test
