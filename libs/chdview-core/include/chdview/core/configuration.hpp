#pragma once

/**
@file
@brief Defines `chdview::core::Configuration` for configuring CHD images.
*/

#include <chdview/util/observable.hpp>

#include <chdview/core/types.hpp>

namespace chdview::core {

/// @brief CHD image configuration.
///
/// Every `chd::Image` owns one instance of this structure. Values can be adjusted before opening the image and most of
/// them can also be changed while the image is in use.
///
/// Thread-safety
/// -------------
/// Unless otherwise noted:
/// - Simple (primitive) types can be safely modified from any thread, but only take effect on the next operation.
/// - Observables cannot be safely modified concurrently with each other. Observers registered by the image lock the
///   image before applying the new value.
struct Configuration {
    /// @brief Hunk cache configuration.
    struct Cache {
        /// @brief Maximum number of decompressed hunks kept in memory.
        ///
        /// Values lower than 1 are treated as 1. Shrinking the cache evicts the least recently used hunks immediately.
        util::Observable<uint32> maxHunks = 16u;
    } cache;

    /// @brief Data verification configuration.
    struct Verify {
        /// @brief Verify the CRC16 of every hunk as it is decoded.
        ///
        /// Hunks that fail verification are reported as `ChecksumMismatch` and are never cached.
        util::Observable<bool> hunkChecksums = true;

        /// @brief Check the byte range of every map entry against the container size while opening the image.
        ///
        /// When enabled, an entry pointing outside the container fails the open with `MapCorrupt`. When disabled, the
        /// same entry is reported as `OutOfBounds` on first access to the hunk.
        bool mapOnOpen = false;
    } verify;

    /// @brief Parent image configuration.
    struct Parent {
        /// @brief Maximum number of parent images traversed to resolve a single hunk.
        ///
        /// Resolution fails with `CyclicParentChain` when the chain is deeper than this.
        uint32 maxChainDepth = 16;
    } parent;
};

} // namespace chdview::core
