#include <chdview/chd/chd_image.hpp>

#include <chdview/chd/chd_devlog.hpp>
#include <chdview/chd/crc16.hpp>

#include <chdview/util/scope_guard.hpp>

#include <xxh3.h>

#include <algorithm>
#include <cassert>
#include <limits>

namespace chdview::chd {

Image::Image()
    : m_cache(configuration.cache.maxHunks.Get())
    , m_verifyChecksums(configuration.verify.hunkChecksums.Get()) {

    configuration.cache.maxHunks.Observe([&](uint32 maxHunks) {
        std::lock_guard lock{m_mutex};
        m_cache.SetCapacity(maxHunks);
    });
    configuration.verify.hunkChecksums.Observe([&](bool verify) {
        std::lock_guard lock{m_mutex};
        m_verifyChecksums = verify;
    });
}

Error Image::Open(std::shared_ptr<media::IBinaryReader> reader) {
    if (!reader) {
        return Error::ReadError;
    }

    Header header{};
    if (Error error = ReadHeader(*reader, header); error != Error::None) {
        devlog::warn<grp::base>("Failed to read header: {}", ToString(error));
        return error;
    }

    std::vector<MapEntry> map;
    if (Error error = DecodeMap(*reader, header, map); error != Error::None) {
        devlog::warn<grp::base>("Failed to read hunk map: {}", ToString(error));
        return error;
    }

    return FinishOpen(std::move(reader), header, std::move(map));
}

Error Image::Open(std::shared_ptr<media::IBinaryReader> reader, const Header &header, std::vector<MapEntry> map) {
    if (!reader) {
        return Error::ReadError;
    }

    Header validated = header;
    if (Error error = ValidateGeometry(validated); error != Error::None) {
        return error;
    }
    if (map.size() != validated.hunkCount) {
        devlog::debug<grp::base>("Map has {} entries, expected {}", map.size(), validated.hunkCount);
        return Error::MapCorrupt;
    }
    for (uint32 hunkNum = 0; hunkNum < map.size(); hunkNum++) {
        const MapEntry &entry = map[hunkNum];
        if (entry.kind == HunkKind::Self && entry.offset >= validated.hunkCount) {
            devlog::debug<grp::base>("Hunk {} references nonexistent hunk {}", hunkNum, entry.offset);
            return Error::MapCorrupt;
        }
        if (entry.IsCodec() && validated.compressors[entry.CodecSlot()] == kCodecNone) {
            devlog::debug<grp::base>("Hunk {} uses empty compressor slot {}", hunkNum, entry.CodecSlot());
            return Error::UnknownCompressor;
        }
    }

    return FinishOpen(std::move(reader), validated, std::move(map));
}

Error Image::FinishOpen(std::shared_ptr<media::IBinaryReader> reader, const Header &header,
                        std::vector<MapEntry> map) {
    std::lock_guard lock{m_mutex};
    CloseLocked();

    if (configuration.verify.mapOnOpen) {
        const uint64 containerSize = reader->Size();
        for (uint32 hunkNum = 0; hunkNum < map.size(); hunkNum++) {
            if (CheckEntryBounds(map[hunkNum], containerSize) != Error::None) {
                devlog::warn<grp::base>("Hunk {} lies outside the container", hunkNum);
                return Error::MapCorrupt;
            }
        }
    }

    m_codecs.clear();
    for (uint32 slot = 0; slot < kNumCompressors; slot++) {
        const uint32 tag = header.compressors[slot];
        if (tag == kCodecNone) {
            m_codecs.emplace_back(codec::UnsupportedCodec{tag});
            continue;
        }
        if (!codec::IsSupported(tag)) {
            devlog::warn<grp::base>("Compressor slot {} uses unsupported codec {}", slot, TagToString(tag));
        }
        m_codecs.push_back(codec::MakeCodec(tag, header.hunkBytes));
    }

    m_reader = std::move(reader);
    m_header = header;
    m_map = std::move(map);

    devlog::info<grp::base>("Opened image: {} bytes in {} hunks of {} bytes", m_header.logicalBytes,
                            m_header.hunkCount, m_header.hunkBytes);
    return Error::None;
}

void Image::Close() {
    std::lock_guard lock{m_mutex};
    CloseLocked();
}

void Image::CloseLocked() {
    m_reader.reset();
    m_header = {};
    m_map.clear();
    m_codecs.clear();
    m_cache.Clear();
    m_parent.reset();
    m_compressed.clear();
}

bool Image::IsOpen() const {
    std::lock_guard lock{m_mutex};
    return m_reader != nullptr;
}

uint64 Image::ContainerSize() const {
    std::lock_guard lock{m_mutex};
    return m_reader ? m_reader->Size() : 0;
}

// -----------------------------------------------------------------------------
// Parent images

// Serializes parent links across all images. Held while walking the ancestors of a new parent and until the link is
// stored, so two attaches can never both pass the cycle check and close a loop between them.
static std::mutex g_attachMutex;

Error Image::AttachParent(const std::shared_ptr<Image> &parent) {
    if (!parent) {
        return Error::MissingParent;
    }

    std::lock_guard attachLock{g_attachMutex};

    SHA1Digest parentSHA1{};
    {
        std::lock_guard parentLock{parent->m_mutex};
        if (!parent->m_reader) {
            return Error::MissingParent;
        }
        parentSHA1 = parent->m_header.sha1;
    }

    // Refuse links that would make this image its own ancestor
    if (parent.get() == this) {
        return Error::CyclicParentChain;
    }
    uint32 depth = 1;
    for (auto ancestor = parent->GetParent(); ancestor; ancestor = ancestor->GetParent()) {
        if (ancestor.get() == this || ++depth > configuration.parent.maxChainDepth) {
            devlog::warn<grp::base>("Parent chain is cyclic or too deep");
            return Error::CyclicParentChain;
        }
    }

    std::lock_guard lock{m_mutex};
    if (!m_header.HasParent()) {
        devlog::warn<grp::base>("Image does not depend on a parent");
        return Error::ParentMismatch;
    }
    if (parentSHA1 != m_header.parentSHA1) {
        devlog::warn<grp::base>("Parent SHA-1 mismatch: expected {}, got {}", chdview::ToString(m_header.parentSHA1),
                                chdview::ToString(parentSHA1));
        return Error::ParentMismatch;
    }

    m_parent = parent;
    m_cache.Clear();
    devlog::info<grp::base>("Attached parent image {}", chdview::ToString(parentSHA1));
    return Error::None;
}

void Image::DetachParent() {
    std::lock_guard lock{m_mutex};
    m_parent.reset();
    m_cache.Clear();
}

std::shared_ptr<Image> Image::GetParent() const {
    std::lock_guard lock{m_mutex};
    return m_parent.lock();
}

// -----------------------------------------------------------------------------
// Data access

Error Image::ReadHunk(uint32 index, std::span<uint8> output) {
    std::lock_guard lock{m_mutex};
    if (index >= m_header.hunkCount) {
        return Error::HunkOutOfRange;
    }
    if (output.size() < m_header.hunkBytes) {
        return Error::OutOfBounds;
    }
    ResolveContext ctx{};
    return ReadHunkLocked(index, output.first(m_header.hunkBytes), ctx);
}

Error Image::ReadBytes(uint64 offset, std::span<uint8> output, uint64 &bytesRead) {
    std::lock_guard lock{m_mutex};
    ResolveContext ctx{};
    return ReadBytesLocked(offset, output, bytesRead, ctx);
}

Error Image::ValidateHunk(uint32 index) {
    std::lock_guard lock{m_mutex};
    if (index >= m_header.hunkCount) {
        return Error::HunkOutOfRange;
    }
    std::vector<uint8> hunk(m_header.hunkBytes);
    ResolveContext ctx{.validate = true};
    return ReadHunkLocked(index, hunk, ctx);
}

Error Image::Validate(uint32 *failedHunk) {
    const uint32 hunkCount = HunkCount();
    for (uint32 hunkNum = 0; hunkNum < hunkCount; hunkNum++) {
        if (Error error = ValidateHunk(hunkNum); error != Error::None) {
            devlog::warn<grp::base>("Hunk {} failed validation: {}", hunkNum, ToString(error));
            if (failedHunk != nullptr) {
                *failedHunk = hunkNum;
            }
            return error;
        }
    }
    return Error::None;
}

Error Image::CalcContentHash(XXH128Hash &hash) {
    XXH3_state_t *xxh3State = XXH3_createState();
    assert(xxh3State != NULL && "Out of memory!");
    util::ScopeGuard sgFreeXXH3State{[&] { XXH3_freeState(xxh3State); }};
    XXH3_128bits_reset(xxh3State);

    std::vector<uint8> buf(std::max<uint32>(HunkBytes(), 1));
    const uint64 size = LogicalSize();
    uint64 offset = 0;
    while (offset < size) {
        uint64 bytesRead = 0;
        if (Error error = ReadBytes(offset, buf, bytesRead); error != Error::None) {
            return error;
        }
        if (bytesRead == 0) {
            break;
        }
        XXH3_128bits_update(xxh3State, buf.data(), bytesRead);
        offset += bytesRead;
    }

    const XXH128_hash_t digest = XXH3_128bits_digest(xxh3State);
    XXH128_canonical_t canonicalHash{};
    XXH128_canonicalFromHash(&canonicalHash, digest);
    std::copy_n(canonicalHash.digest, hash.size(), hash.begin());
    return Error::None;
}

// -----------------------------------------------------------------------------
// Metadata

Error Image::EnumerateMetadata(std::vector<MetadataEntry> &entries) const {
    std::lock_guard lock{m_mutex};
    entries.clear();
    if (!m_reader) {
        return Error::None;
    }
    return chd::EnumerateMetadata(*m_reader, m_header, entries);
}

Error Image::ReadMetadata(uint32 tag, uint32 index, std::vector<uint8> &data, MetadataEntry *entry) const {
    std::lock_guard lock{m_mutex};
    if (!m_reader) {
        return Error::MetadataNotFound;
    }
    return chd::ReadMetadata(*m_reader, m_header, tag, index, data, entry);
}

// -----------------------------------------------------------------------------
// Cache statistics

uint32 Image::CachedHunks() const {
    std::lock_guard lock{m_mutex};
    return m_cache.Size();
}

uint64 Image::CacheHits() const {
    std::lock_guard lock{m_mutex};
    return m_cache.Hits();
}

uint64 Image::CacheMisses() const {
    std::lock_guard lock{m_mutex};
    return m_cache.Misses();
}

// -----------------------------------------------------------------------------
// Hunk resolution

Error Image::ReadHunkLocked(uint32 index, std::span<uint8> output, ResolveContext &ctx) {
    if (!ctx.validate) {
        if (const std::vector<uint8> *cached = m_cache.Find(index)) {
            std::copy(cached->begin(), cached->end(), output.begin());
            return Error::None;
        }
    }

    if (Error error = DecodeHunkLocked(index, output, ctx); error != Error::None) {
        return error;
    }

    if (!ctx.validate) {
        m_cache.Insert(index, std::vector<uint8>(output.begin(), output.end()));
    }
    return Error::None;
}

Error Image::DecodeHunkLocked(uint32 index, std::span<uint8> output, ResolveContext &ctx) {
    const MapEntry &entry = m_map[index];

    switch (entry.kind) {
    case HunkKind::Codec0:
    case HunkKind::Codec1:
    case HunkKind::Codec2:
    case HunkKind::Codec3: {
        m_compressed.resize(entry.length);
        if (Error error = ReadStoredData(entry, m_compressed); error != Error::None) {
            return error;
        }
        if (Error error = codec::Decompress(m_codecs[entry.CodecSlot()], m_compressed, output);
            error != Error::None) {
            devlog::debug<grp::codec>("Hunk {} failed to decompress with {}: {}", index,
                                      TagToString(m_header.compressors[entry.CodecSlot()]), ToString(error));
            return error;
        }
        break;
    }

    case HunkKind::Uncompressed: {
        // Only the last hunk may be stored short, and only down to the end of the logical data
        size_t storedSize = output.size();
        if (entry.length < output.size()) {
            const uint64 logicalTail = m_header.logicalBytes - static_cast<uint64>(index) * m_header.hunkBytes;
            if (index != m_header.hunkCount - 1 || entry.length < logicalTail) {
                return Error::OutOfBounds;
            }
            storedSize = entry.length;
        }
        if (Error error = ReadStoredData(entry, output.first(storedSize)); error != Error::None) {
            return error;
        }
        std::fill(output.begin() + storedSize, output.end(), 0);
        break;
    }

    case HunkKind::Mini: {
        if (entry.length == 0) {
            std::fill(output.begin(), output.end(), 0);
            break;
        }
        const size_t patternSize = std::min<size_t>(entry.length, output.size());
        if (Error error = ReadStoredData(entry, output.first(patternSize)); error != Error::None) {
            return error;
        }
        for (size_t pos = patternSize; pos < output.size(); pos += patternSize) {
            const size_t count = std::min(patternSize, output.size() - pos);
            std::copy_n(output.begin(), count, output.begin() + pos);
        }
        break;
    }

    case HunkKind::Self: {
        const uint32 target = static_cast<uint32>(entry.offset);
        if (target == index || std::find(ctx.selfChain.begin(), ctx.selfChain.end(), target) != ctx.selfChain.end()) {
            devlog::debug<grp::base>("Hunk {} is part of a self-reference cycle", index);
            return Error::CyclicReference;
        }
        ctx.selfChain.push_back(index);
        util::ScopeGuard sgPopChain{[&] { ctx.selfChain.pop_back(); }};
        return ReadHunkLocked(target, output, ctx);
    }

    case HunkKind::Parent: return ReadFromParent(entry.offset, output, ctx);
    }

    if (entry.hasCRC && (m_verifyChecksums || ctx.validate)) {
        const uint16 crc = CalcCRC16(output);
        if (crc != entry.crc) {
            devlog::warn<grp::base>("Hunk {} checksum mismatch: expected {:04X}, got {:04X}", index, entry.crc, crc);
            return Error::ChecksumMismatch;
        }
    }
    return Error::None;
}

Error Image::ReadStoredData(const MapEntry &entry, std::span<uint8> output) {
    const uint64 containerSize = m_reader->Size();
    if (CheckEntryBounds(entry, containerSize) != Error::None) {
        devlog::debug<grp::base>("Stored data at {:X}+{:X} lies outside the container", entry.offset, entry.length);
        return Error::OutOfBounds;
    }
    if (m_reader->Read(entry.offset, output.size(), output) != output.size()) {
        return Error::ReadError;
    }
    return Error::None;
}

Error Image::ReadFromParent(uint64 unitOffset, std::span<uint8> output, const ResolveContext &ctx) {
    std::shared_ptr<Image> parent = m_parent.lock();
    if (!parent) {
        return Error::MissingParent;
    }
    if (ctx.imageChain.size() + 1 > configuration.parent.maxChainDepth) {
        devlog::warn<grp::base>("Parent chain exceeds {} images", configuration.parent.maxChainDepth);
        return Error::CyclicParentChain;
    }
    // The lock of every image already in the chain is held by this thread
    if (parent.get() == this ||
        std::find(ctx.imageChain.begin(), ctx.imageChain.end(), parent.get()) != ctx.imageChain.end()) {
        devlog::warn<grp::base>("Parent chain loops back to a descendant");
        return Error::CyclicParentChain;
    }

    ResolveContext parentCtx{.validate = ctx.validate, .imageChain = ctx.imageChain};
    parentCtx.imageChain.push_back(this);
    uint64 bytesRead = 0;
    if (Error error = parent->ReadAsParent(m_header.parentSHA1, unitOffset, output, bytesRead, parentCtx);
        error != Error::None) {
        return error;
    }

    // Hunks straddling the end of the parent's data are padded with zeros
    std::fill(output.begin() + bytesRead, output.end(), 0);
    return Error::None;
}

Error Image::ReadAsParent(const SHA1Digest &expectedSHA1, uint64 unitOffset, std::span<uint8> output,
                          uint64 &bytesRead, ResolveContext &ctx) {
    std::lock_guard lock{m_mutex};
    bytesRead = 0;
    if (!m_reader) {
        devlog::warn<grp::base>("Parent image was closed after attaching");
        return Error::MissingParent;
    }
    if (m_header.sha1 != expectedSHA1) {
        devlog::warn<grp::base>("Parent image changed after attaching: expected {}, got {}",
                                chdview::ToString(expectedSHA1), chdview::ToString(m_header.sha1));
        return Error::ParentMismatch;
    }

    const uint32 unitBytes = m_header.unitBytes;
    if (unitBytes != 0 && unitOffset > std::numeric_limits<uint64>::max() / unitBytes) {
        return Error::OutOfBounds;
    }
    return ReadBytesLocked(unitOffset * unitBytes, output, bytesRead, ctx);
}

Error Image::ReadBytesLocked(uint64 offset, std::span<uint8> output, uint64 &bytesRead, ResolveContext &ctx) {
    bytesRead = 0;
    if (offset >= m_header.logicalBytes) {
        return Error::None;
    }

    const uint32 hunkBytes = m_header.hunkBytes;
    const uint64 length = std::min<uint64>(output.size(), m_header.logicalBytes - offset);
    std::vector<uint8> hunk;
    uint64 done = 0;
    while (done < length) {
        const uint64 pos = offset + done;
        const uint32 hunkNum = static_cast<uint32>(pos / hunkBytes);
        const uint32 hunkOffset = static_cast<uint32>(pos % hunkBytes);
        const uint64 chunkSize = std::min<uint64>(hunkBytes - hunkOffset, length - done);
        std::span<uint8> dst = output.subspan(done, chunkSize);

        if (hunkOffset == 0 && chunkSize == hunkBytes) {
            if (Error error = ReadHunkLocked(hunkNum, dst, ctx); error != Error::None) {
                return error;
            }
        } else {
            hunk.resize(hunkBytes);
            if (Error error = ReadHunkLocked(hunkNum, hunk, ctx); error != Error::None) {
                return error;
            }
            std::copy_n(hunk.begin() + hunkOffset, chunkSize, dst.begin());
        }
        done += chunkSize;
    }

    bytesRead = length;
    return Error::None;
}

} // namespace chdview::chd
