#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <chdview/chd/crc16.hpp>
#include <chdview/chd/hunk_map.hpp>

#include <chdview/media/binary_reader/binary_reader_mem.hpp>

#include <chdview/util/data_ops.hpp>

#include "chd_test_utils.hpp"

#include <iterator>
#include <vector>

namespace hunk_map {

using namespace chdview;
using namespace chdview::chd;
using chd_test::BitWriter;

static Header MakeHeader(uint32 hunkCount, uint32 hunkBytes = 4096, uint32 unitBytes = 512) {
    Header header{};
    header.compressors = {kCodecZlib, kCodecLZMA, kCodecNone, kCodecNone};
    header.hunkBytes = hunkBytes;
    header.unitBytes = unitBytes;
    header.logicalBytes = static_cast<uint64>(hunkCount) * hunkBytes;
    header.hunkCount = hunkCount;
    return header;
}

static MapEntry Codec(uint32 slot, uint32 length, uint16 crc) {
    MapEntry entry{};
    entry.kind = static_cast<HunkKind>(static_cast<uint32>(HunkKind::Codec0) + slot);
    entry.length = length;
    entry.crc = crc;
    return entry;
}

static MapEntry Raw(uint16 crc) {
    MapEntry entry{};
    entry.kind = HunkKind::Uncompressed;
    entry.crc = crc;
    return entry;
}

static MapEntry Self(uint32 target) {
    MapEntry entry{};
    entry.kind = HunkKind::Self;
    entry.offset = target;
    return entry;
}

static MapEntry Parent(uint64 unitOffset) {
    MapEntry entry{};
    entry.kind = HunkKind::Parent;
    entry.offset = unitOffset;
    return entry;
}

static Error Decode(std::span<const uint8> encoded, const Header &header, std::vector<MapEntry> &entries) {
    return DecodeCompressedMap(encoded.first(kMapHeaderSize), encoded.subspan(kMapHeaderSize), header, entries);
}

TEST_CASE("Compressed map decodes every base type", "[map]") {
    const bool useRLE = GENERATE(false, true);

    const std::vector<MapEntry> source = {
        Codec(0, 1200, 0x1111), Codec(1, 300, 0x2222), Raw(0x3333), Self(0), Parent(96), Codec(0, 1, 0x4444),
    };
    const Header header = MakeHeader(static_cast<uint32>(source.size()));
    const std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, useRLE);

    std::vector<MapEntry> entries;
    REQUIRE(Decode(encoded, header, entries) == Error::None);
    REQUIRE(entries.size() == source.size());

    CHECK(entries[0].kind == HunkKind::Codec0);
    CHECK(entries[0].offset == 124);
    CHECK(entries[0].length == 1200);
    CHECK(entries[0].crc == 0x1111);
    CHECK(entries[0].hasCRC);

    CHECK(entries[1].kind == HunkKind::Codec1);
    CHECK(entries[1].CodecSlot() == 1);
    CHECK(entries[1].offset == 124 + 1200);
    CHECK(entries[1].length == 300);

    CHECK(entries[2].kind == HunkKind::Uncompressed);
    CHECK(entries[2].offset == 124 + 1200 + 300);
    CHECK(entries[2].length == 4096);
    CHECK(entries[2].crc == 0x3333);
    CHECK(entries[2].hasCRC);

    CHECK(entries[3].kind == HunkKind::Self);
    CHECK(entries[3].offset == 0);
    CHECK_FALSE(entries[3].hasCRC);

    CHECK(entries[4].kind == HunkKind::Parent);
    CHECK(entries[4].offset == 96);

    CHECK(entries[5].kind == HunkKind::Codec0);
    CHECK(entries[5].offset == 124 + 1200 + 300 + 4096);
    CHECK(entries[5].length == 1);
}

TEST_CASE("Compressed map expands run-length coded types", "[map]") {
    // Runs long enough for both the small and the large repeat codes
    const uint32 runLength = GENERATE(1u, 3u, 4u, 18u, 19u, 20u, 40u, 300u);

    std::vector<MapEntry> source;
    for (uint32 i = 0; i < runLength; i++) {
        source.push_back(Codec(1, 10 + i % 7, static_cast<uint16>(i)));
    }
    source.push_back(Raw(0xABCD));
    source.push_back(Codec(1, 5, 0));

    const Header header = MakeHeader(static_cast<uint32>(source.size()));
    const std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);

    std::vector<MapEntry> entries;
    REQUIRE(Decode(encoded, header, entries) == Error::None);
    REQUIRE(entries.size() == source.size());

    uint64 offset = 124;
    for (uint32 i = 0; i < runLength; i++) {
        CHECK(entries[i].kind == HunkKind::Codec1);
        CHECK(entries[i].offset == offset);
        CHECK(entries[i].length == 10 + i % 7);
        CHECK(entries[i].crc == i);
        offset += entries[i].length;
    }
    CHECK(entries[runLength].kind == HunkKind::Uncompressed);
    CHECK(entries[runLength + 1].kind == HunkKind::Codec1);
    CHECK(entries[runLength + 1].offset == offset + 4096);
}

TEST_CASE("Compressed map expands self and parent pseudo-types", "[map]") {
    // 4096-byte hunks with 512-byte units: 8 units per hunk
    const Header header = MakeHeader(7);

    BitWriter bw;
    bw.Write(1, 4); // every type gets a 4-bit code
    bw.Write(4, 4);
    bw.Write(13, 4);

    bw.Write(compression::kType0, 4);
    bw.Write(compression::kSelf, 4);
    bw.Write(compression::kSelf0, 4);
    bw.Write(compression::kSelf1, 4);
    bw.Write(compression::kParentSelf, 4);
    bw.Write(compression::kParent1, 4);
    bw.Write(compression::kParent0, 4);

    static constexpr uint8 kLengthBits = 7;
    static constexpr uint8 kSelfBits = 1;
    static constexpr uint8 kParentBits = 1;
    bw.Write(100, kLengthBits); // hunk 0
    bw.Write(0xBEEF, 16);
    bw.Write(0, kSelfBits); // hunk 1
    bw.AlignToByte();

    struct Expected {
        uint8 type;
        uint32 length;
        uint64 offset;
        uint16 crc;
    };
    static constexpr Expected kExpected[] = {
        {compression::kType0, 100, 124, 0xBEEF}, {compression::kSelf, 0, 0, 0},    {compression::kSelf, 0, 0, 0},
        {compression::kSelf, 0, 1, 0},          {compression::kParent, 0, 32, 0}, {compression::kParent, 0, 40, 0},
        {compression::kParent, 0, 40, 0},
    };
    std::vector<uint8> rawMap(std::size(kExpected) * kMapEntrySize);
    for (size_t i = 0; i < std::size(kExpected); i++) {
        uint8 *raw = &rawMap[i * kMapEntrySize];
        raw[0] = kExpected[i].type;
        util::WriteBEN(&raw[1], kExpected[i].length, 3);
        util::WriteBEN(&raw[4], kExpected[i].offset, 6);
        util::WriteBE<uint16>(&raw[10], kExpected[i].crc);
    }

    std::vector<uint8> mapHeader(kMapHeaderSize);
    util::WriteBE<uint32>(&mapHeader[0], static_cast<uint32>(bw.Data().size()));
    util::WriteBEN(&mapHeader[4], 124, 6);
    util::WriteBE<uint16>(&mapHeader[10], CalcCRC16(rawMap));
    mapHeader[12] = kLengthBits;
    mapHeader[13] = kSelfBits;
    mapHeader[14] = kParentBits;

    std::vector<MapEntry> entries;
    REQUIRE(DecodeCompressedMap(mapHeader, bw.Data(), header, entries) == Error::None);
    REQUIRE(entries.size() == 7);
    CHECK(entries[0].kind == HunkKind::Codec0);
    CHECK(entries[1].kind == HunkKind::Self);
    CHECK(entries[1].offset == 0);
    CHECK(entries[2].kind == HunkKind::Self);
    CHECK(entries[2].offset == 0);
    CHECK(entries[3].kind == HunkKind::Self);
    CHECK(entries[3].offset == 1);
    CHECK(entries[4].kind == HunkKind::Parent);
    CHECK(entries[4].offset == 32);
    CHECK(entries[5].kind == HunkKind::Parent);
    CHECK(entries[5].offset == 40);
    CHECK(entries[6].kind == HunkKind::Parent);
    CHECK(entries[6].offset == 40);
}

TEST_CASE("Compressed map rejects a bad map CRC", "[map]") {
    const std::vector<MapEntry> source = {Codec(0, 10, 1), Codec(0, 20, 2)};
    const Header header = MakeHeader(2);
    std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);
    encoded[11] ^= 0x01;

    std::vector<MapEntry> entries;
    CHECK(Decode(encoded, header, entries) == Error::MapCorrupt);
}

TEST_CASE("Compressed map rejects self references to nonexistent hunks", "[map]") {
    const std::vector<MapEntry> source = {Codec(0, 10, 1), Self(2)};
    const Header header = MakeHeader(2);
    const std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);

    std::vector<MapEntry> entries;
    CHECK(Decode(encoded, header, entries) == Error::MapCorrupt);
}

TEST_CASE("Compressed map rejects codec hunks in empty compressor slots", "[map]") {
    const std::vector<MapEntry> source = {Codec(2, 10, 1)};
    const Header header = MakeHeader(1);
    const std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);

    std::vector<MapEntry> entries;
    CHECK(Decode(encoded, header, entries) == Error::UnknownCompressor);
}

TEST_CASE("Compressed map rejects invalid compression types", "[map]") {
    BitWriter bw;
    bw.Write(1, 4);
    bw.Write(4, 4);
    bw.Write(13, 4);
    bw.Write(14, 4);
    bw.AlignToByte();

    std::vector<uint8> mapHeader(kMapHeaderSize);
    mapHeader[12] = 8;
    mapHeader[13] = 8;
    mapHeader[14] = 8;

    std::vector<MapEntry> entries;
    CHECK(DecodeCompressedMap(mapHeader, bw.Data(), MakeHeader(1), entries) == Error::MapCorrupt);
}

TEST_CASE("Compressed map rejects oversized field widths", "[map]") {
    const std::vector<MapEntry> source = {Codec(0, 10, 1)};
    const Header header = MakeHeader(1);
    std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);
    encoded[12] = 33;

    std::vector<MapEntry> entries;
    CHECK(Decode(encoded, header, entries) == Error::MapCorrupt);
}

TEST_CASE("Compressed map reports truncated map data", "[map]") {
    std::vector<MapEntry> source;
    for (uint32 i = 0; i < 16; i++) {
        source.push_back(Codec(i & 1, 1000 + i, static_cast<uint16>(i * 3)));
    }
    const Header header = MakeHeader(static_cast<uint32>(source.size()));
    std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, false);
    encoded.resize(encoded.size() - 8);

    std::vector<MapEntry> entries;
    CHECK(Decode(encoded, header, entries) == Error::TruncatedStream);
}

TEST_CASE("Compressed maps too small for the hunk count are corrupt", "[map]") {
    Header header = MakeHeader(1, kMaxHunkBytes);
    header.logicalBytes = static_cast<uint64>(UINT32_MAX) * kMaxHunkBytes;
    header.hunkCount = UINT32_MAX;
    header.mapOffset = kHeaderSize;

    std::vector<uint8> container(kHeaderSize + kMapHeaderSize + 8);
    util::WriteBE<uint32>(&container[kHeaderSize], 8);
    media::MemoryBinaryReader reader{container};

    std::vector<MapEntry> entries;
    CHECK(DecodeMap(reader, header, entries) == Error::MapCorrupt);
    CHECK(entries.empty());
}

TEST_CASE("Compressed maps of the smallest possible size still decode", "[map]") {
    // A single hunk type repeated with the large run code
    std::vector<MapEntry> source(300, Self(0));
    source[0] = Raw(0x1234);
    const Header header = MakeHeader(static_cast<uint32>(source.size()));
    const std::vector<uint8> encoded = chd_test::EncodeCompressedMap(source, header.hunkBytes, 124, true);

    std::vector<MapEntry> entries;
    REQUIRE(Decode(encoded, header, entries) == Error::None);
    CHECK(entries.size() == 300);
    CHECK(entries[299].kind == HunkKind::Self);
}

TEST_CASE("Uncompressed map entries address whole hunks", "[map]") {
    Header header = MakeHeader(3);
    header.compressors = {};

    std::vector<uint8> raw(3 * kUncompressedMapEntrySize);
    util::WriteBE<uint32>(&raw[0], 1);
    util::WriteBE<uint32>(&raw[4], 0);
    util::WriteBE<uint32>(&raw[8], 7);

    SECTION("standalone images treat zero entries as zero-filled hunks") {
        std::vector<MapEntry> entries;
        REQUIRE(DecodeUncompressedMap(raw, header, entries) == Error::None);
        REQUIRE(entries.size() == 3);
        CHECK(entries[0].kind == HunkKind::Uncompressed);
        CHECK(entries[0].offset == 4096);
        CHECK(entries[0].length == 4096);
        CHECK_FALSE(entries[0].hasCRC);
        CHECK(entries[1].kind == HunkKind::Mini);
        CHECK(entries[1].length == 0);
        CHECK(entries[2].offset == 7 * 4096);
    }

    SECTION("child images read zero entries from the same hunk of the parent") {
        header.parentSHA1[0] = 0x42;
        std::vector<MapEntry> entries;
        REQUIRE(DecodeUncompressedMap(raw, header, entries) == Error::None);
        CHECK(entries[1].kind == HunkKind::Parent);
        CHECK(entries[1].offset == 1 * 4096 / 512);
    }
}

TEST_CASE("Map regions outside the container are corrupt", "[map]") {
    Header header = MakeHeader(4);
    header.mapOffset = 100;

    media::MemoryBinaryReader reader{std::vector<uint8>(110)};
    std::vector<MapEntry> entries;
    CHECK(DecodeMap(reader, header, entries) == Error::MapCorrupt);

    header.compressors = {};
    CHECK(DecodeMap(reader, header, entries) == Error::MapCorrupt);
}

TEST_CASE("Entry bounds are checked against the container size", "[map]") {
    MapEntry entry = Codec(0, 100, 0);
    entry.offset = 900;
    CHECK(CheckEntryBounds(entry, 1000) == Error::None);
    CHECK(CheckEntryBounds(entry, 999) == Error::OutOfBounds);

    entry.offset = ~0ull - 10;
    CHECK(CheckEntryBounds(entry, 1000) == Error::OutOfBounds);

    // Hunks without stored data are always in bounds
    CHECK(CheckEntryBounds(Self(3), 0) == Error::None);
    CHECK(CheckEntryBounds(Parent(3), 0) == Error::None);
}

} // namespace hunk_map
