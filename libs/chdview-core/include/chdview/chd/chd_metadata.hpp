#pragma once

/**
@file
@brief Access to the metadata chain of CHD images.

Metadata entries form a singly linked list starting at the header's metadata offset. Each entry has a 16-byte header
(tag, flags, 24-bit length and the offset of the next entry) followed by its payload. Payloads are returned verbatim.
*/

#include "chd_defs.hpp"
#include "chd_error.hpp"
#include "chd_header.hpp"

#include <chdview/media/binary_reader/binary_reader.hpp>

#include <chdview/core/types.hpp>

#include <vector>

namespace chdview::chd {

/// @brief Describes one metadata entry.
struct MetadataEntry {
    uint32 tag = 0;
    uint8 flags = 0;
    uint32 length = 0;     ///< Payload length
    uint64 offset = 0;     ///< Container offset of the entry header
    uint64 dataOffset = 0; ///< Container offset of the payload
};

/// @brief Lists every entry of the metadata chain in order.
/// @return `FormatError` if the chain loops or an entry lies outside the container; `ReadError` on short reads
Error EnumerateMetadata(const media::IBinaryReader &reader, const Header &header, std::vector<MetadataEntry> &entries);

/// @brief Finds the `index`th entry (0-based) with the given tag.
/// @param[in] tag the tag to search for, or `kMetadataWildcard` to match any tag
/// @return `MetadataNotFound` if there are not enough matching entries
Error FindMetadata(const media::IBinaryReader &reader, const Header &header, uint32 tag, uint32 index,
                   MetadataEntry &entry);

/// @brief Reads the payload of the `index`th entry with the given tag.
Error ReadMetadata(const media::IBinaryReader &reader, const Header &header, uint32 tag, uint32 index,
                   std::vector<uint8> &data, MetadataEntry *entry = nullptr);

} // namespace chdview::chd
