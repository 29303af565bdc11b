#include <chdview/chd/chd_metadata.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/util/data_ops.hpp>

#include <array>
#include <unordered_set>

namespace chdview::chd {

// Walks the metadata chain, invoking fn(entry) for each entry until it returns false
template <typename Fn>
static Error WalkMetadata(const media::IBinaryReader &reader, const Header &header, Fn &&fn) {
    const uint64 containerSize = reader.Size();
    std::unordered_set<uint64> visited;
    uint64 offset = header.metaOffset;
    while (offset != 0) {
        if (!visited.insert(offset).second) {
            devlog::debug<grp::base>("Metadata chain loops back to offset {:X}", offset);
            return Error::FormatError;
        }
        if (offset > containerSize || kMetadataHeaderSize > containerSize - offset) {
            devlog::debug<grp::base>("Metadata entry at {:X} lies outside the container", offset);
            return Error::FormatError;
        }

        std::array<uint8, kMetadataHeaderSize> raw{};
        if (reader.Read(offset, raw.size(), raw) != raw.size()) {
            return Error::ReadError;
        }

        MetadataEntry entry{};
        entry.tag = util::ReadBE<uint32>(&raw[0]);
        entry.flags = raw[4];
        entry.length = static_cast<uint32>(util::ReadBEN(&raw[5], 3));
        entry.offset = offset;
        entry.dataOffset = offset + kMetadataHeaderSize;
        if (entry.length > containerSize - entry.dataOffset) {
            devlog::debug<grp::base>("Metadata payload at {:X} lies outside the container", entry.dataOffset);
            return Error::FormatError;
        }
        if (!fn(entry)) {
            return Error::None;
        }

        offset = util::ReadBE<uint64>(&raw[8]);
    }
    return Error::None;
}

Error EnumerateMetadata(const media::IBinaryReader &reader, const Header &header, std::vector<MetadataEntry> &entries) {
    entries.clear();
    return WalkMetadata(reader, header, [&](const MetadataEntry &entry) {
        entries.push_back(entry);
        return true;
    });
}

Error FindMetadata(const media::IBinaryReader &reader, const Header &header, uint32 tag, uint32 index,
                   MetadataEntry &entry) {
    bool found = false;
    Error error = WalkMetadata(reader, header, [&](const MetadataEntry &current) {
        if (tag != kMetadataWildcard && current.tag != tag) {
            return true;
        }
        if (index-- != 0) {
            return true;
        }
        entry = current;
        found = true;
        return false;
    });
    if (error != Error::None) {
        return error;
    }
    return found ? Error::None : Error::MetadataNotFound;
}

Error ReadMetadata(const media::IBinaryReader &reader, const Header &header, uint32 tag, uint32 index,
                   std::vector<uint8> &data, MetadataEntry *entry) {
    MetadataEntry found{};
    if (Error error = FindMetadata(reader, header, tag, index, found); error != Error::None) {
        return error;
    }
    data.resize(found.length);
    if (reader.Read(found.dataOffset, found.length, data) != found.length) {
        return Error::ReadError;
    }
    if (entry != nullptr) {
        *entry = found;
    }
    return Error::None;
}

} // namespace chdview::chd
