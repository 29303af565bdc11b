#pragma once

/**
@file
@brief Hunk map types and decoders.
*/

#include "chd_error.hpp"
#include "chd_header.hpp"

#include <chdview/media/binary_reader/binary_reader.hpp>

#include <chdview/core/types.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace chdview::chd {

/// @brief How a hunk is stored.
enum class HunkKind : uint8 {
    Codec0,       ///< Compressed with the codec in compressor slot 0
    Codec1,       ///< Compressed with the codec in compressor slot 1
    Codec2,       ///< Compressed with the codec in compressor slot 2
    Codec3,       ///< Compressed with the codec in compressor slot 3
    Uncompressed, ///< Stored verbatim
    Mini,         ///< A short pattern tiled to fill the hunk; an empty pattern is a zero-filled hunk
    Self,         ///< Identical to another hunk of the same image
    Parent,       ///< Read from the parent image
};

std::string_view ToString(HunkKind kind);

/// @brief Describes how to obtain the contents of a single hunk.
struct MapEntry {
    HunkKind kind = HunkKind::Mini;

    /// @brief Number of stored bytes. Zero for self and parent hunks.
    uint32 length = 0;

    /// @brief Meaning depends on the kind:
    /// - codec, uncompressed and mini hunks: container offset of the stored bytes
    /// - self hunks: index of the referenced hunk
    /// - parent hunks: offset into the parent's logical data, in units of the parent's unit size
    uint64 offset = 0;

    /// @brief CRC16 of the decoded hunk, valid if `hasCRC` is set.
    uint16 crc = 0;
    bool hasCRC = false;

    bool IsCodec() const {
        return kind <= HunkKind::Codec3;
    }

    /// @brief Returns the compressor slot of a codec hunk.
    uint32 CodecSlot() const {
        return static_cast<uint32>(kind) - static_cast<uint32>(HunkKind::Codec0);
    }

    /// @brief Determines if the hunk's contents are stored in the container.
    bool HasStoredData() const {
        return IsCodec() || kind == HunkKind::Uncompressed || (kind == HunkKind::Mini && length > 0);
    }
};

/// @brief Reads and decodes the hunk map of an image.
///
/// Picks the uncompressed or compressed map format based on the header. Structural problems are reported as
/// `MapCorrupt` (including a map region that does not fit in the container, a failed map CRC and self references to
/// hunks that do not exist). Codec hunks that select an empty compressor slot are reported as `UnknownCompressor`.
///
/// The byte ranges of individual entries are not checked against the container; see `CheckEntryBounds`.
///
/// @param[in] reader the container
/// @param[in] header the parsed header
/// @param[out] entries receives exactly `header.hunkCount` entries
Error DecodeMap(const media::IBinaryReader &reader, const Header &header, std::vector<MapEntry> &entries);

/// @brief Decodes an uncompressed map: one 4-byte big-endian entry per hunk holding `offset / hunkBytes`.
///
/// A zero entry refers to the same hunk in the parent image if the header declares a parent, otherwise it is a
/// zero-filled hunk.
Error DecodeUncompressedMap(std::span<const uint8> rawMap, const Header &header, std::vector<MapEntry> &entries);

/// @brief Decodes a compressed map.
/// @param[in] mapHeader the 16-byte map header
/// @param[in] compressed the compressed map data following the map header
/// @param[in] header the image header
/// @param[out] entries receives exactly `header.hunkCount` entries
Error DecodeCompressedMap(std::span<const uint8> mapHeader, std::span<const uint8> compressed, const Header &header,
                          std::vector<MapEntry> &entries);

/// @brief Checks that the stored bytes of an entry lie inside a container of `containerSize` bytes.
/// @return `OutOfBounds` if the range overflows or extends past the end of the container
Error CheckEntryBounds(const MapEntry &entry, uint64 containerSize);

} // namespace chdview::chd
