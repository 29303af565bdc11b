#include <chdview/media/cdrom_ecc.hpp>

#include <array>

namespace chdview::media::cdrom {

// GF(2^8) multiply-by-2 table and its inverse for (1 ^ 2), over the polynomial x^8 + x^4 + x^3 + x^2 + 1
static constexpr auto kECCTables = [] {
    struct {
        std::array<uint8, 256> low{};
        std::array<uint8, 256> high{};
    } tables;
    for (uint32 i = 0; i < 256; ++i) {
        const uint32 j = (i << 1) ^ ((i & 0x80) ? 0x11D : 0);
        tables.low[i] = static_cast<uint8>(j);
        tables.high[i ^ static_cast<uint8>(j)] = static_cast<uint8>(i);
    }
    return tables;
}();

static constexpr auto kECCPOffsets = [] {
    std::array<std::array<uint16, kECCPComponents>, kECCPNumBytes> offsets{};
    for (uint32 b = 0; b < kECCPNumBytes; ++b) {
        for (uint32 j = 0; j < kECCPComponents; ++j) {
            offsets[b][j] = static_cast<uint16>(b + kECCPNumBytes * j);
        }
    }
    return offsets;
}();

static constexpr auto kECCQOffsets = [] {
    std::array<std::array<uint16, kECCQComponents>, kECCQNumBytes> offsets{};
    for (uint32 b = 0; b < kECCQNumBytes; ++b) {
        for (uint32 j = 0; j < kECCQComponents; ++j) {
            offsets[b][j] = static_cast<uint16>(((44 * j + 43 * (b / 2)) % 1118) * 2 + (b & 1));
        }
    }
    return offsets;
}();

static uint8 SourceByte(std::span<const uint8, kSectorDataSize> sector, uint32 offset) {
    // Mode 2 sectors exclude the header from the parity calculation
    if (sector[kModeOffset] == 2 && offset < 4) {
        return 0x00;
    }
    return sector[kSyncOffset + kSyncSize + offset];
}

template <size_t N>
static void ComputeBytes(std::span<const uint8, kSectorDataSize> sector, const std::array<uint16, N> &row, uint8 &val1,
                         uint8 &val2) {
    val1 = 0;
    val2 = 0;
    for (uint16 offset : row) {
        const uint8 b = SourceByte(sector, offset);
        val1 ^= b;
        val2 ^= b;
        val1 = kECCTables.low[val1];
    }
    val1 = kECCTables.high[kECCTables.low[val1] ^ val2];
    val2 ^= val1;
}

void GenerateECC(std::span<uint8, kSectorDataSize> sector) {
    std::span<const uint8, kSectorDataSize> input{sector};
    for (uint32 b = 0; b < kECCPNumBytes; ++b) {
        ComputeBytes(input, kECCPOffsets[b], sector[kECCPOffset + b], sector[kECCPOffset + kECCPNumBytes + b]);
    }
    // Q parity covers the P parity bytes, so it must be computed after them
    for (uint32 b = 0; b < kECCQNumBytes; ++b) {
        ComputeBytes(input, kECCQOffsets[b], sector[kECCQOffset + b], sector[kECCQOffset + kECCQNumBytes + b]);
    }
}

bool VerifyECC(std::span<const uint8, kSectorDataSize> sector) {
    for (uint32 b = 0; b < kECCPNumBytes; ++b) {
        uint8 val1, val2;
        ComputeBytes(sector, kECCPOffsets[b], val1, val2);
        if (sector[kECCPOffset + b] != val1 || sector[kECCPOffset + kECCPNumBytes + b] != val2) {
            return false;
        }
    }
    for (uint32 b = 0; b < kECCQNumBytes; ++b) {
        uint8 val1, val2;
        ComputeBytes(sector, kECCQOffsets[b], val1, val2);
        if (sector[kECCQOffset + b] != val1 || sector[kECCQOffset + kECCQNumBytes + b] != val2) {
            return false;
        }
    }
    return true;
}

} // namespace chdview::media::cdrom
