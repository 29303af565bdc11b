#pragma once

/**
@file
@brief Canonical, length-limited Huffman decoder shared by the map decoder and the `huff` codec.
*/

#include "bit_reader.hpp"
#include "chd_error.hpp"

#include <chdview/core/types.hpp>

#include <span>
#include <vector>

namespace chdview::chd {

/// @brief Decodes symbols of a canonical prefix code with at most `maxBits` bits per code.
///
/// The code is described by a table of code lengths, one per symbol, which is either imported from a bitstream or
/// supplied directly. Codes are assigned canonically from the lengths: longer codes take the numerically lower values,
/// and codes of equal length are assigned in ascending symbol order. This matches the codes produced by CHD encoders.
///
/// Decoding uses a flat lookup table indexed by the next `maxBits` bits of the stream.
class HuffmanDecoder {
public:
    /// @brief Creates a decoder for `numCodes` symbols (up to 256) with codes of at most `maxBits` bits (up to 16).
    HuffmanDecoder(uint32 numCodes, uint32 maxBits);

    /// @brief Imports a code length table stored with the simple run-length scheme used by compressed hunk maps.
    ///
    /// Each length is stored in 3, 4 or 5 bits depending on `maxBits`. The value 1 is an escape: it is followed by
    /// either another 1 (a literal length of 1) or a length and a repeat count minus 3.
    Error ImportTreeRLE(BitReader &reader);

    /// @brief Imports a code length table that is itself Huffman-coded, as used by the `huff` hunk codec.
    Error ImportTreeHuffman(BitReader &reader);

    /// @brief Replaces the code length table and rebuilds the code.
    /// @param[in] lengths the code length of each symbol; 0 means the symbol is unused
    Error SetCodeLengths(std::span<const uint8> lengths);

    /// @brief Decodes one symbol from the reader.
    /// @param[in,out] reader the bitstream
    /// @param[out] symbol receives the decoded symbol
    /// @return `TruncatedStream` if the code runs past the end of the stream, `InvalidHuffmanTable` if the bits do not
    /// match any code
    Error Decode(BitReader &reader, uint32 &symbol) const;

    uint32 NumCodes() const {
        return m_numCodes;
    }

    uint32 MaxBits() const {
        return m_maxBits;
    }

    /// @brief Returns the length in bits of the symbol's code, or 0 if the symbol is unused.
    uint8 CodeLength(uint32 symbol) const {
        return m_nodes[symbol].numBits;
    }

    /// @brief Returns the canonical code assigned to the symbol.
    uint32 Code(uint32 symbol) const {
        return m_nodes[symbol].bits;
    }

private:
    struct Node {
        uint32 bits = 0;    // canonical code
        uint8 numBits = 0;  // code length
    };

    // Lookup table entries hold (symbol << 5) | numBits; zero marks a bit pattern not covered by any code
    using LookupEntry = uint32;

    uint32 m_numCodes;
    uint32 m_maxBits;
    std::vector<Node> m_nodes;
    std::vector<LookupEntry> m_lookup;

    Error AssignCanonicalCodes();
    void BuildLookupTable();
};

} // namespace chdview::chd
