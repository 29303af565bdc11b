#pragma once

/**
@file
@brief CHD decoder error codes.
*/

#include <chdview/core/types.hpp>

#include <string_view>

namespace chdview::chd {

/// @brief Result of fallible CHD operations.
///
/// Every fallible operation returns one of these values. Outputs are returned through out-parameters and are left in
/// an unspecified state when the result is not `Error::None`.
enum class Error : uint8 {
    None, ///< The operation succeeded.

    FormatError,        ///< Bad magic, malformed header or malformed metadata chain.
    UnsupportedVersion, ///< The header declares a CHD version other than 5.
    MapCorrupt,         ///< The hunk map is malformed, fails its CRC or references data outside the container.
    InvalidHuffmanTable, ///< A Huffman code length table does not form a valid prefix code.
    TruncatedStream,     ///< A bitstream ran out of bits before decoding finished.
    UnknownCompressor,   ///< A hunk uses a codec that is not declared or not supported.
    DecompressionError,  ///< A codec rejected the hunk payload.
    ChecksumMismatch,    ///< The decoded hunk does not match its stored CRC16.

    CyclicReference,   ///< A chain of self-hunk references loops back on itself.
    CyclicParentChain, ///< The parent chain contains a cycle or exceeds the maximum depth.
    MissingParent,     ///< A parent hunk was requested but no live parent image is attached.
    ParentMismatch,    ///< The parent image's SHA-1 does not match the digest declared by the child.

    OutOfBounds,    ///< A hunk's stored byte range lies outside the container.
    HunkOutOfRange, ///< The requested hunk index is not less than the hunk count.
    InvalidSeek,    ///< A seek target lies outside the logical stream or overflows.
    ReadError,      ///< The backing reader returned fewer bytes than requested.

    MetadataNotFound, ///< No metadata entry matches the requested tag and index.
};

/// @brief Returns a human-readable description of the error.
/// @param[in] error the error code
/// @return a static string describing the error
std::string_view ToString(Error error);

} // namespace chdview::chd
