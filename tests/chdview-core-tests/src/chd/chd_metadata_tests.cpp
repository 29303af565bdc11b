#include <catch2/catch_test_macros.hpp>

#include <chdview/chd/chd_image.hpp>
#include <chdview/chd/chd_metadata.hpp>

#include <chdview/media/binary_reader/binary_reader_mem.hpp>

#include <chdview/util/data_ops.hpp>

#include "chd_test_utils.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace chd_metadata {

using namespace chdview;
using namespace chdview::chd;

static std::vector<uint8> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

static const std::vector<uint8> kTrack1 = Bytes("TRACK:1 TYPE:MODE1_RAW SUBTYPE:NONE FRAMES:1000 PREGAP:0");
static const std::vector<uint8> kTrack2 = Bytes("TRACK:2 TYPE:AUDIO SUBTYPE:NONE FRAMES:2000 PREGAP:150");
static const std::vector<uint8> kBlob = {0x00, 0x01, 0x02, 0xFF};

static chd_test::ImageBuilder::Output BuildImage() {
    const std::vector<uint8> data = chd_test::MakeNoise(2048, 1);
    chd_test::ImageBuilder builder{2048, 2048, 512};
    builder.AddRawHunk(data);
    builder.AddMetadata(kCDROMTrackMetadata2Tag, kMetadataFlagChecksum, kTrack1);
    builder.AddMetadata(MakeTag('B', 'L', 'O', 'B'), 0, kBlob);
    builder.AddMetadata(kCDROMTrackMetadata2Tag, kMetadataFlagChecksum, kTrack2);
    return builder.Build();
}

TEST_CASE("Metadata entries are enumerated in chain order", "[metadata]") {
    Image image{};
    REQUIRE(image.Open(std::make_shared<media::MemoryBinaryReader>(BuildImage().bytes)) == Error::None);

    std::vector<MetadataEntry> entries;
    REQUIRE(image.EnumerateMetadata(entries) == Error::None);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].tag == kCDROMTrackMetadata2Tag);
    CHECK(entries[0].flags == kMetadataFlagChecksum);
    CHECK(entries[0].length == kTrack1.size());
    CHECK(entries[0].offset == image.GetHeader().metaOffset);
    CHECK(entries[0].dataOffset == entries[0].offset + kMetadataHeaderSize);
    CHECK(entries[1].tag == MakeTag('B', 'L', 'O', 'B'));
    CHECK(entries[1].flags == 0);
    CHECK(entries[1].length == kBlob.size());
    CHECK(entries[2].tag == kCDROMTrackMetadata2Tag);
    CHECK(TagToString(entries[2].tag) == "CHT2");
}

TEST_CASE("Metadata is found by tag and index", "[metadata]") {
    Image image{};
    REQUIRE(image.Open(std::make_shared<media::MemoryBinaryReader>(BuildImage().bytes)) == Error::None);

    std::vector<uint8> data;
    MetadataEntry entry{};
    REQUIRE(image.ReadMetadata(kCDROMTrackMetadata2Tag, 0, data, &entry) == Error::None);
    CHECK(data == kTrack1);
    REQUIRE(image.ReadMetadata(kCDROMTrackMetadata2Tag, 1, data, &entry) == Error::None);
    CHECK(data == kTrack2);
    CHECK(entry.length == kTrack2.size());

    SECTION("wildcard tag") {
        REQUIRE(image.ReadMetadata(kMetadataWildcard, 1, data) == Error::None);
        CHECK(data == kBlob);
        REQUIRE(image.ReadMetadata(kMetadataWildcard, 2, data) == Error::None);
        CHECK(data == kTrack2);
    }
    SECTION("missing entries") {
        CHECK(image.ReadMetadata(kCDROMTrackMetadata2Tag, 2, data) == Error::MetadataNotFound);
        CHECK(image.ReadMetadata(kHardDiskMetadataTag, 0, data) == Error::MetadataNotFound);
        CHECK(image.ReadMetadata(kMetadataWildcard, 3, data) == Error::MetadataNotFound);
    }
}

TEST_CASE("Images without metadata have an empty chain", "[metadata]") {
    chd_test::ImageBuilder builder{1024, 1024, 512};
    builder.AddRawHunk(chd_test::MakeNoise(1024, 2));

    Image image{};
    REQUIRE(image.Open(std::make_shared<media::MemoryBinaryReader>(builder.Build().bytes)) == Error::None);
    CHECK(image.GetHeader().metaOffset == 0);

    std::vector<MetadataEntry> entries(4);
    REQUIRE(image.EnumerateMetadata(entries) == Error::None);
    CHECK(entries.empty());

    std::vector<uint8> data;
    CHECK(image.ReadMetadata(kMetadataWildcard, 0, data) == Error::MetadataNotFound);
}

TEST_CASE("Malformed metadata chains are rejected", "[metadata]") {
    const chd_test::ImageBuilder::Output output = BuildImage();
    std::vector<uint8> bytes = output.bytes;

    Header header{};
    REQUIRE(ParseHeader(bytes, header) == Error::None);
    std::vector<MetadataEntry> entries;
    {
        const media::MemoryBinaryReader reader{bytes};
        REQUIRE(EnumerateMetadata(reader, header, entries) == Error::None);
        REQUIRE(entries.size() == 3);
    }

    SECTION("loop") {
        // Point the last entry back at the first
        util::WriteBE<uint64>(&bytes[entries[2].offset + 8], entries[0].offset);
    }
    SECTION("entry outside the container") {
        util::WriteBE<uint64>(&bytes[entries[1].offset + 8], bytes.size() - 4);
    }
    SECTION("payload outside the container") {
        util::WriteBEN(&bytes[entries[2].offset + 5], 0xFFFFFF, 3);
    }

    const media::MemoryBinaryReader reader{bytes};
    CHECK(EnumerateMetadata(reader, header, entries) == Error::FormatError);

    MetadataEntry entry{};
    CHECK(FindMetadata(reader, header, MakeTag('N', 'O', 'N', 'E'), 0, entry) == Error::FormatError);
}

} // namespace chd_metadata
