#pragma once

#include <chdview/core/types.hpp>

#include <array>

namespace chdview::media::cdrom {

inline constexpr uint32 kSectorDataSize = 2352; // raw sector data, including sync, header, EDC and ECC
inline constexpr uint32 kSubcodeDataSize = 96;
inline constexpr uint32 kFrameSize = kSectorDataSize + kSubcodeDataSize;

inline constexpr uint32 kSyncOffset = 0;
inline constexpr uint32 kSyncSize = 12;
inline constexpr uint32 kModeOffset = 15;

inline constexpr uint32 kECCPOffset = 0x81C;
inline constexpr uint32 kECCPNumBytes = 86;
inline constexpr uint32 kECCPComponents = 24;

inline constexpr uint32 kECCQOffset = kECCPOffset + 2 * kECCPNumBytes;
inline constexpr uint32 kECCQNumBytes = 52;
inline constexpr uint32 kECCQComponents = 43;

inline constexpr std::array<uint8, kSyncSize> kSyncHeader = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                                                             0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};

} // namespace chdview::media::cdrom
