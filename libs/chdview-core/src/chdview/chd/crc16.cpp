#include <chdview/chd/crc16.hpp>

#include <array>

namespace chdview::chd {

static constexpr auto kCRCTable = [] {
    std::array<uint16, 256> crcTable{};
    for (uint32 i = 0; i < 256; ++i) {
        uint16 c = static_cast<uint16>(i << 8);
        for (uint32 j = 0; j < 8; ++j) {
            c = static_cast<uint16>((c << 1) ^ ((c & 0x8000) ? 0x1021 : 0));
        }
        crcTable[i] = c;
    }
    return crcTable;
}();

uint16 CalcCRC16(std::span<const uint8> data) {
    uint16 crc = 0xFFFF;
    for (uint8 b : data) {
        crc = static_cast<uint16>((crc << 8) ^ kCRCTable[(crc >> 8) ^ b]);
    }
    return crc;
}

} // namespace chdview::chd
