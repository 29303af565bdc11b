#pragma once

#include <chdview/core/types.hpp>

#include <span>

namespace chdview::chd {

// Calculates the CRC-16/CCITT-FALSE (polynomial 0x1021, initial value 0xFFFF) checksum used by CHD maps and hunks.
uint16 CalcCRC16(std::span<const uint8> data);

} // namespace chdview::chd
