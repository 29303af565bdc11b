#pragma once

/**
@file
@brief CHD v5 container format definitions.
*/

#include <chdview/util/size_ops.hpp>

#include <chdview/core/types.hpp>

#include <array>
#include <string>

namespace chdview::chd {

/// @brief Builds a four-character code as stored in CHD headers and metadata entries.
constexpr uint32 MakeTag(char a, char b, char c, char d) {
    return (static_cast<uint32>(static_cast<uint8>(a)) << 24u) | (static_cast<uint32>(static_cast<uint8>(b)) << 16u) |
           (static_cast<uint32>(static_cast<uint8>(c)) << 8u) | static_cast<uint32>(static_cast<uint8>(d));
}

/// @brief Converts a four-character code into a printable string.
///
/// Non-printable characters are replaced with `.`.
std::string TagToString(uint32 tag);

// -----------------------------------------------------------------------------
// Header

inline constexpr std::array<char, 8> kMagic = {'M', 'C', 'o', 'm', 'p', 'r', 'H', 'D'};
inline constexpr uint32 kVersion = 5;
inline constexpr uint32 kHeaderSize = 124;
inline constexpr uint32 kMaxHunkBytes = 512_KiB;
inline constexpr uint32 kNumCompressors = 4;
inline constexpr uint32 kSHA1Size = 20;

namespace hdr {
    inline constexpr uint32 kMagicOffset = 0;
    inline constexpr uint32 kLengthOffset = 8;
    inline constexpr uint32 kVersionOffset = 12;
    inline constexpr uint32 kCompressorsOffset = 16;
    inline constexpr uint32 kLogicalBytesOffset = 32;
    inline constexpr uint32 kMapOffsetOffset = 40;
    inline constexpr uint32 kMetaOffsetOffset = 48;
    inline constexpr uint32 kHunkBytesOffset = 56;
    inline constexpr uint32 kUnitBytesOffset = 60;
    inline constexpr uint32 kRawSHA1Offset = 64;
    inline constexpr uint32 kSHA1Offset = 84;
    inline constexpr uint32 kParentSHA1Offset = 104;
} // namespace hdr

// -----------------------------------------------------------------------------
// Codecs

inline constexpr uint32 kCodecNone = 0;
inline constexpr uint32 kCodecZlib = MakeTag('z', 'l', 'i', 'b');
inline constexpr uint32 kCodecLZMA = MakeTag('l', 'z', 'm', 'a');
inline constexpr uint32 kCodecHuffman = MakeTag('h', 'u', 'f', 'f');
inline constexpr uint32 kCodecFLAC = MakeTag('f', 'l', 'a', 'c');
inline constexpr uint32 kCodecCDZlib = MakeTag('c', 'd', 'z', 'l');
inline constexpr uint32 kCodecCDLZMA = MakeTag('c', 'd', 'l', 'z');
inline constexpr uint32 kCodecCDFLAC = MakeTag('c', 'd', 'f', 'l');

// -----------------------------------------------------------------------------
// Map

/// @brief Compression types as stored in the compressed map.
///
/// Types 0 to 6 are stored in the decoded map; the remaining values only appear in the compressed map stream and are
/// expanded while decoding it.
namespace compression {
    inline constexpr uint8 kType0 = 0;
    inline constexpr uint8 kType1 = 1;
    inline constexpr uint8 kType2 = 2;
    inline constexpr uint8 kType3 = 3;
    inline constexpr uint8 kNone = 4;
    inline constexpr uint8 kSelf = 5;
    inline constexpr uint8 kParent = 6;

    inline constexpr uint8 kRLESmall = 7;
    inline constexpr uint8 kRLELarge = 8;
    inline constexpr uint8 kSelf0 = 9;
    inline constexpr uint8 kSelf1 = 10;
    inline constexpr uint8 kParentSelf = 11;
    inline constexpr uint8 kParent0 = 12;
    inline constexpr uint8 kParent1 = 13;
} // namespace compression

inline constexpr uint32 kMapHeaderSize = 16;
inline constexpr uint32 kMapEntrySize = 12;             // decoded compressed-map entry
inline constexpr uint32 kUncompressedMapEntrySize = 4;  // uncompressed map entry

// -----------------------------------------------------------------------------
// Metadata

inline constexpr uint32 kMetadataHeaderSize = 16;
inline constexpr uint32 kMetadataWildcard = 0; ///< Matches any metadata tag
inline constexpr uint8 kMetadataFlagChecksum = 0x01;

inline constexpr uint32 kHardDiskMetadataTag = MakeTag('G', 'D', 'D', 'D');
inline constexpr uint32 kCDROMTrackMetadataTag = MakeTag('C', 'H', 'T', 'R');
inline constexpr uint32 kCDROMTrackMetadata2Tag = MakeTag('C', 'H', 'T', '2');
inline constexpr uint32 kGDROMTrackMetadataTag = MakeTag('C', 'H', 'G', 'D');

} // namespace chdview::chd
