#include <chdview/chd/huffman.hpp>

#include <chdview/util/bit_ops.hpp>
#include <chdview/util/dev_assert.hpp>

#include <algorithm>
#include <array>

namespace chdview::chd {

HuffmanDecoder::HuffmanDecoder(uint32 numCodes, uint32 maxBits)
    : m_numCodes(numCodes)
    , m_maxBits(maxBits)
    , m_nodes(numCodes)
    , m_lookup(1u << maxBits) {
    CHDVIEW_DEV_ASSERT(numCodes <= 256);
    CHDVIEW_DEV_ASSERT(maxBits >= 1 && maxBits <= 16);
}

Error HuffmanDecoder::ImportTreeRLE(BitReader &reader) {
    const uint32 numBits = m_maxBits >= 16 ? 5 : m_maxBits >= 8 ? 4 : 3;

    uint32 curNode = 0;
    while (curNode < m_numCodes) {
        uint8 nodeBits;
        if (!reader.Read(numBits, nodeBits)) {
            return Error::TruncatedStream;
        }
        if (nodeBits != 1) {
            // A non-one value is just a raw length
            m_nodes[curNode++].numBits = nodeBits;
            continue;
        }

        // A one value is an escape code
        if (!reader.Read(numBits, nodeBits)) {
            return Error::TruncatedStream;
        }
        if (nodeBits == 1) {
            // A double one is a literal one
            m_nodes[curNode++].numBits = nodeBits;
            continue;
        }

        // Otherwise it's a length followed by a repeat count
        uint32 repCount;
        if (!reader.Read(numBits, repCount)) {
            return Error::TruncatedStream;
        }
        repCount += 3;
        if (curNode + repCount > m_numCodes) {
            return Error::InvalidHuffmanTable;
        }
        while (repCount--) {
            m_nodes[curNode++].numBits = nodeBits;
        }
    }

    if (Error error = AssignCanonicalCodes(); error != Error::None) {
        return error;
    }
    BuildLookupTable();
    return Error::None;
}

Error HuffmanDecoder::ImportTreeHuffman(BitReader &reader) {
    // The code lengths are themselves coded with a small 24-symbol tree. Symbol 0 starts a run of the previous length,
    // any other symbol N is the length N - 1.
    HuffmanDecoder smallTree{24, 6};
    std::array<uint8, 24> smallLengths{};
    uint32 start;
    if (!reader.Read(3, smallLengths[0]) || !reader.Read(3, start)) {
        return Error::TruncatedStream;
    }
    start += 1;
    uint32 count = 0;
    for (uint32 index = 1; index < smallLengths.size(); index++) {
        if (index < start || count == 7) {
            smallLengths[index] = 0;
        } else {
            if (!reader.Read(3, count)) {
                return Error::TruncatedStream;
            }
            smallLengths[index] = count == 7 ? 0 : count;
        }
    }
    if (Error error = smallTree.SetCodeLengths(smallLengths); error != Error::None) {
        return error;
    }

    // Long runs store an extra count with enough bits to cover the whole table
    const uint32 rleFullBits = bit::bit_length(m_numCodes - 9);

    uint8 last = 0;
    uint32 curCode = 0;
    while (curCode < m_numCodes) {
        uint32 value;
        if (Error error = smallTree.Decode(reader, value); error != Error::None) {
            return error;
        }
        if (value != 0) {
            last = static_cast<uint8>(value - 1);
            m_nodes[curCode++].numBits = last;
            continue;
        }

        uint32 runLength;
        if (!reader.Read(3, runLength)) {
            return Error::TruncatedStream;
        }
        runLength += 2;
        if (runLength == 7 + 2) {
            uint32 extra;
            if (!reader.Read(rleFullBits, extra)) {
                return Error::TruncatedStream;
            }
            runLength += extra;
        }
        for (; runLength != 0 && curCode < m_numCodes; runLength--) {
            m_nodes[curCode++].numBits = last;
        }
    }

    if (Error error = AssignCanonicalCodes(); error != Error::None) {
        return error;
    }
    BuildLookupTable();
    return Error::None;
}

Error HuffmanDecoder::SetCodeLengths(std::span<const uint8> lengths) {
    if (lengths.size() != m_numCodes) {
        return Error::InvalidHuffmanTable;
    }
    for (uint32 i = 0; i < m_numCodes; i++) {
        m_nodes[i].numBits = lengths[i];
    }
    if (Error error = AssignCanonicalCodes(); error != Error::None) {
        return error;
    }
    BuildLookupTable();
    return Error::None;
}

Error HuffmanDecoder::Decode(BitReader &reader, uint32 &symbol) const {
    const LookupEntry lookup = m_lookup[reader.Peek(m_maxBits)];
    if (lookup == 0) {
        return Error::InvalidHuffmanTable;
    }
    if (!reader.Skip(lookup & 0x1F)) {
        return Error::TruncatedStream;
    }
    symbol = lookup >> 5u;
    return Error::None;
}

Error HuffmanDecoder::AssignCanonicalCodes() {
    // Build up a histogram of bit lengths
    std::array<uint32, 33> bitHisto{};
    for (const Node &node : m_nodes) {
        if (node.numBits > m_maxBits) {
            return Error::InvalidHuffmanTable;
        }
        bitHisto[node.numBits]++;
    }

    // For each code length, determine the starting code number. Shorter codes start past the prefixes taken by longer
    // codes; an odd count leaves an unused slot, which makes the code under-full. More than two one-bit prefixes means
    // the lengths overflow the code space.
    uint32 curStart = 0;
    for (uint32 codeLen = 32; codeLen > 0; codeLen--) {
        const uint32 total = curStart + bitHisto[codeLen];
        if (codeLen == 1 && total > 2) {
            return Error::InvalidHuffmanTable;
        }
        bitHisto[codeLen] = curStart;
        curStart = (total + 1) >> 1u;
    }

    // Now assign canonical codes
    for (Node &node : m_nodes) {
        node.bits = node.numBits > 0 ? bitHisto[node.numBits]++ : 0;
    }
    return Error::None;
}

void HuffmanDecoder::BuildLookupTable() {
    std::fill(m_lookup.begin(), m_lookup.end(), 0);
    for (uint32 curCode = 0; curCode < m_numCodes; curCode++) {
        const Node &node = m_nodes[curCode];
        if (node.numBits == 0) {
            continue;
        }

        // Fill every table slot whose leading bits match the code
        const LookupEntry value = (curCode << 5u) | node.numBits;
        const uint32 shift = m_maxBits - node.numBits;
        const uint32 first = node.bits << shift;
        const uint32 last = ((node.bits + 1) << shift) - 1;
        std::fill(m_lookup.begin() + first, m_lookup.begin() + last + 1, value);
    }
}

} // namespace chdview::chd
