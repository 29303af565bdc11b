#include <chdview/chd/hunk_map.hpp>

#include <chdview/chd/bit_reader.hpp>
#include <chdview/chd/chd_devlog.hpp>
#include <chdview/chd/crc16.hpp>
#include <chdview/chd/huffman.hpp>

#include <chdview/util/data_ops.hpp>

#include <array>

namespace chdview::chd {

std::string_view ToString(HunkKind kind) {
    switch (kind) {
    case HunkKind::Codec0: return "codec 0";
    case HunkKind::Codec1: return "codec 1";
    case HunkKind::Codec2: return "codec 2";
    case HunkKind::Codec3: return "codec 3";
    case HunkKind::Uncompressed: return "uncompressed";
    case HunkKind::Mini: return "mini";
    case HunkKind::Self: return "self";
    case HunkKind::Parent: return "parent";
    }
    return "invalid";
}

Error DecodeUncompressedMap(std::span<const uint8> rawMap, const Header &header, std::vector<MapEntry> &entries) {
    if (rawMap.size() < header.UncompressedMapSize()) {
        return Error::MapCorrupt;
    }

    entries.assign(header.hunkCount, {});
    for (uint32 hunkNum = 0; hunkNum < header.hunkCount; hunkNum++) {
        MapEntry &entry = entries[hunkNum];
        const uint64 offset =
            static_cast<uint64>(util::ReadBE<uint32>(&rawMap[hunkNum * kUncompressedMapEntrySize])) * header.hunkBytes;
        if (offset != 0) {
            entry.kind = HunkKind::Uncompressed;
            entry.length = header.hunkBytes;
            entry.offset = offset;
        } else if (header.HasParent()) {
            entry.kind = HunkKind::Parent;
            entry.offset = static_cast<uint64>(hunkNum) * header.hunkBytes / header.unitBytes;
        } else {
            entry.kind = HunkKind::Mini;
        }
    }
    return Error::None;
}

Error DecodeCompressedMap(std::span<const uint8> mapHeader, std::span<const uint8> compressed, const Header &header,
                          std::vector<MapEntry> &entries) {
    if (mapHeader.size() < kMapHeaderSize) {
        return Error::MapCorrupt;
    }
    const uint64 firstOffset = util::ReadBEN(&mapHeader[4], 6);
    const uint16 mapCRC = util::ReadBE<uint16>(&mapHeader[10]);
    const uint8 lengthBits = mapHeader[12];
    const uint8 selfBits = mapHeader[13];
    const uint8 parentBits = mapHeader[14];
    if (lengthBits > 32 || selfBits > 32 || parentBits > 32) {
        devlog::debug<grp::map>("Invalid field widths: length={} self={} parent={}", lengthBits, selfBits, parentBits);
        return Error::MapCorrupt;
    }

    // Every Huffman symbol takes at least one bit, and the longest run (an RLE escape plus two count symbols) covers
    // 274 hunks. Maps too small to describe every hunk are rejected before allocating per-hunk storage.
    static constexpr uint64 kMaxHunksPerRun = 1 + 2 + 16 + (15 << 4) + 15;
    const uint64 maxHunks = (static_cast<uint64>(compressed.size()) * 8 / 3 + 1) * kMaxHunksPerRun;
    if (header.hunkCount > maxHunks) {
        devlog::debug<grp::map>("Compressed map of {} bytes cannot describe {} hunks", compressed.size(),
                                header.hunkCount);
        return Error::MapCorrupt;
    }

    BitReader reader{compressed};

    // First decode the compression types, which are Huffman-coded with run-length escapes
    HuffmanDecoder decoder{16, 8};
    if (Error error = decoder.ImportTreeRLE(reader); error != Error::None) {
        devlog::debug<grp::map>("Failed to import compression type tree: {}", ToString(error));
        return error;
    }

    std::vector<uint8> types(header.hunkCount);
    uint8 lastComp = 0;
    uint32 repCount = 0;
    for (uint32 hunkNum = 0; hunkNum < header.hunkCount; hunkNum++) {
        if (repCount > 0) {
            types[hunkNum] = lastComp;
            repCount--;
            continue;
        }

        uint32 value;
        if (Error error = decoder.Decode(reader, value); error != Error::None) {
            return error;
        }
        if (value == compression::kRLESmall) {
            uint32 count;
            if (Error error = decoder.Decode(reader, count); error != Error::None) {
                return error;
            }
            types[hunkNum] = lastComp;
            repCount = 2 + count;
        } else if (value == compression::kRLELarge) {
            uint32 countHi, countLo;
            if (Error error = decoder.Decode(reader, countHi); error != Error::None) {
                return error;
            }
            if (Error error = decoder.Decode(reader, countLo); error != Error::None) {
                return error;
            }
            types[hunkNum] = lastComp;
            repCount = 2 + 16 + (countHi << 4u) + countLo;
        } else {
            types[hunkNum] = lastComp = static_cast<uint8>(value);
        }
    }

    // Then iterate through the hunks and extract the per-hunk fields, expanding pseudo-types into base types.
    // The expanded entries are also serialized into their 12-byte form to verify the map CRC.
    std::vector<uint8> rawMap(static_cast<size_t>(header.hunkCount) * kMapEntrySize);
    entries.assign(header.hunkCount, {});
    const uint64 unitsPerHunk = header.hunkBytes / header.unitBytes;
    uint64 curOffset = firstOffset;
    uint64 lastSelf = 0;
    uint64 lastParent = 0;
    for (uint32 hunkNum = 0; hunkNum < header.hunkCount; hunkNum++) {
        uint8 type = types[hunkNum];
        uint64 offset = curOffset;
        uint32 length = 0;
        uint16 crc = 0;
        switch (type) {
        case compression::kType0:
        case compression::kType1:
        case compression::kType2:
        case compression::kType3:
            if (!reader.Read(lengthBits, length) || !reader.Read(16, crc)) {
                return Error::TruncatedStream;
            }
            curOffset += length;
            break;

        case compression::kNone:
            length = header.hunkBytes;
            curOffset += length;
            if (!reader.Read(16, crc)) {
                return Error::TruncatedStream;
            }
            break;

        case compression::kSelf:
            if (!reader.Read(selfBits, offset)) {
                return Error::TruncatedStream;
            }
            lastSelf = offset;
            break;

        case compression::kParent:
            if (!reader.Read(parentBits, offset)) {
                return Error::TruncatedStream;
            }
            lastParent = offset;
            break;

        case compression::kSelf1: lastSelf++; [[fallthrough]];
        case compression::kSelf0:
            type = compression::kSelf;
            offset = lastSelf;
            break;

        case compression::kParentSelf:
            type = compression::kParent;
            offset = static_cast<uint64>(hunkNum) * unitsPerHunk;
            lastParent = offset;
            break;

        case compression::kParent1: lastParent += unitsPerHunk; [[fallthrough]];
        case compression::kParent0:
            type = compression::kParent;
            offset = lastParent;
            break;

        default:
            devlog::debug<grp::map>("Hunk {} has invalid compression type {}", hunkNum, type);
            return Error::MapCorrupt;
        }

        uint8 *raw = &rawMap[static_cast<size_t>(hunkNum) * kMapEntrySize];
        raw[0] = type;
        util::WriteBEN(&raw[1], length, 3);
        util::WriteBEN(&raw[4], offset, 6);
        util::WriteBE<uint16>(&raw[10], crc);

        MapEntry &entry = entries[hunkNum];
        entry.length = length;
        entry.offset = offset;
        entry.crc = crc;
        switch (type) {
        case compression::kNone:
            entry.kind = HunkKind::Uncompressed;
            entry.hasCRC = true;
            break;
        case compression::kSelf:
            entry.kind = HunkKind::Self;
            if (offset >= header.hunkCount) {
                devlog::debug<grp::map>("Hunk {} references nonexistent hunk {}", hunkNum, offset);
                return Error::MapCorrupt;
            }
            break;
        case compression::kParent: entry.kind = HunkKind::Parent; break;
        default:
            entry.kind = static_cast<HunkKind>(static_cast<uint8>(HunkKind::Codec0) + type);
            entry.hasCRC = true;
            if (header.compressors[type] == kCodecNone) {
                devlog::debug<grp::map>("Hunk {} uses empty compressor slot {}", hunkNum, type);
                return Error::UnknownCompressor;
            }
            break;
        }
    }

    if (CalcCRC16(rawMap) != mapCRC) {
        devlog::debug<grp::map>("Map CRC mismatch");
        return Error::MapCorrupt;
    }
    return Error::None;
}

Error DecodeMap(const media::IBinaryReader &reader, const Header &header, std::vector<MapEntry> &entries) {
    const uint64 containerSize = reader.Size();

    if (!header.IsCompressed()) {
        const uint64 mapSize = header.UncompressedMapSize();
        if (header.mapOffset > containerSize || mapSize > containerSize - header.mapOffset) {
            devlog::debug<grp::map>("Uncompressed map does not fit in the container");
            return Error::MapCorrupt;
        }
        std::vector<uint8> rawMap(mapSize);
        if (reader.Read(header.mapOffset, mapSize, rawMap) != mapSize) {
            return Error::ReadError;
        }
        return DecodeUncompressedMap(rawMap, header, entries);
    }

    if (header.mapOffset > containerSize || kMapHeaderSize > containerSize - header.mapOffset) {
        devlog::debug<grp::map>("Map header does not fit in the container");
        return Error::MapCorrupt;
    }
    std::array<uint8, kMapHeaderSize> mapHeader{};
    if (reader.Read(header.mapOffset, mapHeader.size(), mapHeader) != mapHeader.size()) {
        return Error::ReadError;
    }

    const uint32 mapBytes = util::ReadBE<uint32>(&mapHeader[0]);
    if (mapBytes > containerSize - header.mapOffset - kMapHeaderSize) {
        devlog::debug<grp::map>("Compressed map of {} bytes does not fit in the container", mapBytes);
        return Error::MapCorrupt;
    }
    std::vector<uint8> compressed(mapBytes);
    if (reader.Read(header.mapOffset + kMapHeaderSize, mapBytes, compressed) != mapBytes) {
        return Error::ReadError;
    }
    if (Error error = DecodeCompressedMap(mapHeader, compressed, header, entries); error != Error::None) {
        devlog::debug<grp::map>("Failed to decode compressed map: {}", ToString(error));
        return error;
    }
    devlog::info<grp::map>("Decoded compressed map with {} hunks", header.hunkCount);
    return Error::None;
}

Error CheckEntryBounds(const MapEntry &entry, uint64 containerSize) {
    if (!entry.HasStoredData()) {
        return Error::None;
    }
    if (entry.offset > containerSize || entry.length > containerSize - entry.offset) {
        return Error::OutOfBounds;
    }
    return Error::None;
}

} // namespace chdview::chd
