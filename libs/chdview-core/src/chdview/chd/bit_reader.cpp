#include <chdview/chd/bit_reader.hpp>

namespace chdview::chd {

uint32 BitReader::Peek(uint32 numBits) const {
    if (numBits == 0) {
        return 0;
    }

    // Gather a 40-bit window starting at the byte containing the cursor; 32 bits plus up to 7 bits of misalignment
    // always fit in it
    const uint64 byteIndex = m_bitPos >> 3ull;
    const uint32 bitOffset = static_cast<uint32>(m_bitPos & 7ull);
    uint64 window = 0;
    for (uint64 i = 0; i < 5; i++) {
        window <<= 8ull;
        if (byteIndex + i < m_data.size()) {
            window |= m_data[byteIndex + i];
        }
    }
    const uint64 mask = (1ull << numBits) - 1ull;
    return static_cast<uint32>(((window << bitOffset) >> (40u - numBits)) & mask);
}

bool BitReader::Skip(uint64 numBits) {
    if (numBits > BitsRemaining()) {
        return false;
    }
    m_bitPos += numBits;
    return true;
}

} // namespace chdview::chd
