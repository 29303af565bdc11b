#pragma once

/**
@file
@brief Defines `chdview::chd::Image`, an opened CHD v5 image.
*/

#include "chd_error.hpp"
#include "chd_header.hpp"
#include "chd_metadata.hpp"
#include "hunk_cache.hpp"
#include "hunk_map.hpp"

#include "codec/codec.hpp"

#include <chdview/media/binary_reader/binary_reader.hpp>

#include <chdview/core/configuration.hpp>
#include <chdview/core/hash.hpp>
#include <chdview/core/types.hpp>

#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace chdview::chd {

/// @brief An opened CHD v5 image.
///
/// Decodes hunks on demand, keeps recently used hunks in a bounded cache and resolves self and parent references.
///
/// Opening only reads the header and the hunk map. Problems with individual hunks (bad checksums, corrupt payloads,
/// missing parents) surface when the hunk is first accessed and only fail that access.
///
/// Thread-safety
/// -------------
/// All public methods are safe to call from multiple threads; accesses to the cache and codec state are serialized by
/// an internal mutex. Children resolving hunks from a shared parent lock the parent while they read from it.
///
/// Images must be managed by a `std::shared_ptr` to be attached as parents.
class Image {
public:
    Image();

    Image(const Image &) = delete;
    Image(Image &&) = delete;

    Image &operator=(const Image &) = delete;
    Image &operator=(Image &&) = delete;

    /// @brief Image configuration. Adjust before opening the image; observable values may be changed at any time.
    core::Configuration configuration;

    /// @brief Opens a CHD container.
    ///
    /// Fails if the header is invalid or the hunk map is corrupt. On failure the image is left closed.
    ///
    /// @param[in] reader the container
    Error Open(std::shared_ptr<media::IBinaryReader> reader);

    /// @brief Opens an image from an already decoded header and map, reading hunk data from `reader`.
    ///
    /// The header geometry and the map are validated the same way as when they are read from a container.
    ///
    /// @param[in] reader the container holding the hunk data referenced by the map
    /// @param[in] header the image header
    /// @param[in] map one entry per hunk
    Error Open(std::shared_ptr<media::IBinaryReader> reader, const Header &header, std::vector<MapEntry> map);

    /// @brief Closes the image, releasing the reader, map and cache. The parent link is also dropped.
    void Close();

    bool IsOpen() const;

    /// @brief Returns the image header. Only valid while the image is open.
    const Header &GetHeader() const {
        return m_header;
    }

    /// @brief Returns the decoded hunk map. Only valid while the image is open.
    const std::vector<MapEntry> &GetMap() const {
        return m_map;
    }

    uint64 LogicalSize() const {
        return m_header.logicalBytes;
    }

    uint32 HunkBytes() const {
        return m_header.hunkBytes;
    }

    uint32 HunkCount() const {
        return m_header.hunkCount;
    }

    uint32 UnitBytes() const {
        return m_header.unitBytes;
    }

    /// @brief Returns the size of the container.
    uint64 ContainerSize() const;

    // -------------------------------------------------------------------------
    // Parent images

    /// @brief Links this image to its parent.
    ///
    /// The link is weak: the parent must be kept alive by the caller for as long as parent hunks are read. One parent
    /// may back any number of children. A parent that is closed or reopened on a different image after attaching
    /// fails parent hunk reads with `MissingParent` or `ParentMismatch`.
    ///
    /// Attaching is serialized across all images, so concurrent attaches cannot link a cycle.
    ///
    /// @param[in] parent the parent image
    /// @return `ParentMismatch` if this image does not declare a parent or the parent's SHA-1 differs from the declared
    /// one; `CyclicParentChain` if the link would create a cycle; `MissingParent` if `parent` is null or not open
    Error AttachParent(const std::shared_ptr<Image> &parent);

    /// @brief Removes the parent link.
    void DetachParent();

    /// @brief Returns the attached parent, or `nullptr` if none is attached or it no longer exists.
    std::shared_ptr<Image> GetParent() const;

    // -------------------------------------------------------------------------
    // Data access

    /// @brief Reads the decoded contents of a hunk.
    ///
    /// Repeated reads of the same hunk return identical bytes regardless of cache evictions.
    ///
    /// @param[in] index the hunk index
    /// @param[out] output receives `HunkBytes()` bytes; must be at least that large
    Error ReadHunk(uint32 index, std::span<uint8> output);

    /// @brief Reads decoded bytes from the logical data.
    ///
    /// Reads are clamped to the logical size; reading at or past the end succeeds with zero bytes.
    ///
    /// @param[in] offset the logical offset
    /// @param[out] output receives the data
    /// @param[out] bytesRead receives the number of bytes copied
    Error ReadBytes(uint64 offset, std::span<uint8> output, uint64 &bytesRead);

    /// @brief Decodes a hunk bypassing the cache and verifies its checksum regardless of configuration.
    ///
    /// Self hunks are verified through the hunk they reference. Parent hunks carry no checksum of their own and are
    /// verified by decoding them from the parent.
    Error ValidateHunk(uint32 index);

    /// @brief Validates every hunk in order, stopping at the first failure.
    /// @param[out] failedHunk if not null, receives the index of the hunk that failed
    Error Validate(uint32 *failedHunk = nullptr);

    /// @brief Computes the XXH128 hash of the whole logical data.
    Error CalcContentHash(XXH128Hash &hash);

    // -------------------------------------------------------------------------
    // Metadata

    Error EnumerateMetadata(std::vector<MetadataEntry> &entries) const;

    Error ReadMetadata(uint32 tag, uint32 index, std::vector<uint8> &data, MetadataEntry *entry = nullptr) const;

    // -------------------------------------------------------------------------
    // Cache statistics

    uint32 CachedHunks() const;
    uint64 CacheHits() const;
    uint64 CacheMisses() const;

private:
    mutable std::mutex m_mutex;

    std::shared_ptr<media::IBinaryReader> m_reader;
    Header m_header{};
    std::vector<MapEntry> m_map;
    std::vector<codec::Codec> m_codecs; // one per compressor slot
    HunkCache m_cache;
    bool m_verifyChecksums = true;

    std::weak_ptr<Image> m_parent;

    std::vector<uint8> m_compressed;

    // State carried through the recursive resolution of a single hunk
    struct ResolveContext {
        bool validate = false;                 // bypass the cache and force checksum verification
        std::vector<uint32> selfChain;         // hunks currently being resolved through self references
        std::vector<const Image *> imageChain; // descendants whose locks are held, nearest last
    };

    Error FinishOpen(std::shared_ptr<media::IBinaryReader> reader, const Header &header, std::vector<MapEntry> map);
    void CloseLocked();

    Error ReadHunkLocked(uint32 index, std::span<uint8> output, ResolveContext &ctx);
    Error DecodeHunkLocked(uint32 index, std::span<uint8> output, ResolveContext &ctx);
    Error ReadStoredData(const MapEntry &entry, std::span<uint8> output);
    Error ReadFromParent(uint64 unitOffset, std::span<uint8> output, const ResolveContext &ctx);
    Error ReadAsParent(const SHA1Digest &expectedSHA1, uint64 unitOffset, std::span<uint8> output, uint64 &bytesRead,
                       ResolveContext &ctx);
    Error ReadBytesLocked(uint64 offset, std::span<uint8> output, uint64 &bytesRead, ResolveContext &ctx);
};

} // namespace chdview::chd
