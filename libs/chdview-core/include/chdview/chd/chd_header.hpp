#pragma once

/**
@file
@brief CHD v5 header parsing.
*/

#include "chd_defs.hpp"
#include "chd_error.hpp"

#include <chdview/media/binary_reader/binary_reader.hpp>

#include <chdview/core/hash.hpp>
#include <chdview/core/types.hpp>

#include <array>
#include <span>

namespace chdview::chd {

/// @brief The fixed-layout CHD v5 header.
struct Header {
    uint32 length = kHeaderSize;
    uint32 version = kVersion;
    std::array<uint32, kNumCompressors> compressors{}; ///< Codec tags; `kCodecNone` marks an empty slot
    uint64 logicalBytes = 0;                           ///< Size of the decoded data
    uint64 mapOffset = 0;                              ///< Container offset of the hunk map
    uint64 metaOffset = 0;                             ///< Container offset of the first metadata entry, or 0
    uint32 hunkBytes = 0;                              ///< Size of each hunk
    uint32 unitBytes = 0;                              ///< Size of each unit; parent references are counted in units
    uint32 hunkCount = 0;                              ///< Derived: ceil(logicalBytes / hunkBytes)
    SHA1Digest rawSHA1{};                              ///< SHA-1 of the decoded data
    SHA1Digest sha1{};                                 ///< SHA-1 of the decoded data and metadata
    SHA1Digest parentSHA1{};                           ///< SHA-1 of the parent image, or all zeros

    /// @brief Determines if the image depends on a parent image.
    bool HasParent() const {
        return !IsEmpty(parentSHA1);
    }

    /// @brief Determines if the hunk map is stored compressed.
    ///
    /// Images whose first compressor slot is empty store every hunk uncompressed and use the simpler 4-byte map.
    bool IsCompressed() const {
        return compressors[0] != kCodecNone;
    }

    /// @brief Returns the number of codecs declared in the header.
    uint32 NumCompressors() const;

    /// @brief Returns the size in bytes of an uncompressed hunk map.
    ///
    /// The size of compressed maps is stored in their own map header.
    uint64 UncompressedMapSize() const {
        return static_cast<uint64>(hunkCount) * kUncompressedMapEntrySize;
    }
};

/// @brief Parses and validates a v5 header from its raw bytes.
/// @param[in] data the first `kHeaderSize` bytes of the container
/// @param[out] header receives the parsed header
/// @return `FormatError` for a bad magic, length or geometry; `UnsupportedVersion` for versions other than 5
Error ParseHeader(std::span<const uint8> data, Header &header);

/// @brief Reads and parses the header at the start of the container.
/// @return `FormatError` if the container is shorter than a header, otherwise the result of `ParseHeader`
Error ReadHeader(const media::IBinaryReader &reader, Header &header);

/// @brief Validates the geometry of a header: hunk and unit sizes and the derived hunk count.
///
/// Recomputes `hunkCount` from `logicalBytes` and `hunkBytes`.
Error ValidateGeometry(Header &header);

} // namespace chdview::chd
