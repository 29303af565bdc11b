#pragma once

#include "cdrom_defs.hpp"

#include <span>

namespace chdview::media::cdrom {

// Regenerates the P and Q parity bytes of a raw Mode 1 or Mode 2 Form 1 sector.
// In Mode 2 sectors the header bytes are treated as zero, as required by the Yellow Book.
void GenerateECC(std::span<uint8, kSectorDataSize> sector);

// Determines if the P and Q parity bytes of the sector match its contents.
bool VerifyECC(std::span<const uint8, kSectorDataSize> sector);

} // namespace chdview::media::cdrom
