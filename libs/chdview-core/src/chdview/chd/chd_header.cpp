#include <chdview/chd/chd_header.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/util/data_ops.hpp>

#include <algorithm>

namespace chdview::chd {

uint32 Header::NumCompressors() const {
    return static_cast<uint32>(std::count_if(compressors.begin(), compressors.end(),
                                             [](uint32 tag) { return tag != kCodecNone; }));
}

Error ValidateGeometry(Header &header) {
    if (header.hunkBytes == 0 || header.hunkBytes > kMaxHunkBytes) {
        devlog::debug<grp::base>("Invalid hunk size {}", header.hunkBytes);
        return Error::FormatError;
    }
    if (header.unitBytes == 0 || header.unitBytes > header.hunkBytes || header.hunkBytes % header.unitBytes != 0) {
        devlog::debug<grp::base>("Invalid unit size {} for hunk size {}", header.unitBytes, header.hunkBytes);
        return Error::FormatError;
    }

    const uint64 hunkCount = (header.logicalBytes + header.hunkBytes - 1) / header.hunkBytes;
    if (hunkCount > UINT32_MAX) {
        devlog::debug<grp::base>("Too many hunks: {}", hunkCount);
        return Error::FormatError;
    }
    header.hunkCount = static_cast<uint32>(hunkCount);
    return Error::None;
}

Error ParseHeader(std::span<const uint8> data, Header &header) {
    if (data.size() < kHeaderSize) {
        return Error::FormatError;
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), data.begin() + hdr::kMagicOffset)) {
        devlog::debug<grp::base>("Bad magic");
        return Error::FormatError;
    }

    header.length = util::ReadBE<uint32>(&data[hdr::kLengthOffset]);
    header.version = util::ReadBE<uint32>(&data[hdr::kVersionOffset]);
    if (header.version != kVersion) {
        devlog::debug<grp::base>("Unsupported version {}", header.version);
        return Error::UnsupportedVersion;
    }
    if (header.length != kHeaderSize) {
        devlog::debug<grp::base>("Unexpected header length {}", header.length);
        return Error::FormatError;
    }

    for (uint32 i = 0; i < kNumCompressors; i++) {
        header.compressors[i] = util::ReadBE<uint32>(&data[hdr::kCompressorsOffset + i * sizeof(uint32)]);
    }
    header.logicalBytes = util::ReadBE<uint64>(&data[hdr::kLogicalBytesOffset]);
    header.mapOffset = util::ReadBE<uint64>(&data[hdr::kMapOffsetOffset]);
    header.metaOffset = util::ReadBE<uint64>(&data[hdr::kMetaOffsetOffset]);
    header.hunkBytes = util::ReadBE<uint32>(&data[hdr::kHunkBytesOffset]);
    header.unitBytes = util::ReadBE<uint32>(&data[hdr::kUnitBytesOffset]);
    std::copy_n(&data[hdr::kRawSHA1Offset], kSHA1Size, header.rawSHA1.begin());
    std::copy_n(&data[hdr::kSHA1Offset], kSHA1Size, header.sha1.begin());
    std::copy_n(&data[hdr::kParentSHA1Offset], kSHA1Size, header.parentSHA1.begin());

    return ValidateGeometry(header);
}

Error ReadHeader(const media::IBinaryReader &reader, Header &header) {
    std::array<uint8, kHeaderSize> data{};
    if (reader.Read(0, data.size(), data) != data.size()) {
        // Anything shorter than a header cannot be a CHD at all
        return Error::FormatError;
    }
    return ParseHeader(data, header);
}

} // namespace chdview::chd
