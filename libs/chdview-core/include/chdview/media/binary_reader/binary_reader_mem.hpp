#pragma once

#include "binary_reader.hpp"

#include <algorithm>
#include <span>
#include <vector>

namespace chdview::media {

// Implementation of IBinaryReader that reads from an in-memory buffer.
class MemoryBinaryReader final : public IBinaryReader {
public:
    // Initializes an empty in-memory buffer.
    MemoryBinaryReader() = default;

    // Initializes an in-memory buffer with a copy of the provided data.
    MemoryBinaryReader(std::span<const uint8> data)
        : m_data(data.begin(), data.end()) {}

    // Initializes an in-memory buffer using the vector as the buffer.
    // The given vector is moved into this object.
    MemoryBinaryReader(std::vector<uint8> &&data) {
        m_data.swap(data);
    }

    MemoryBinaryReader(const MemoryBinaryReader &) = default;
    MemoryBinaryReader(MemoryBinaryReader &&) = default;

    MemoryBinaryReader &operator=(const MemoryBinaryReader &) = default;
    MemoryBinaryReader &operator=(MemoryBinaryReader &&) = default;

    uintmax_t Size() const final {
        return m_data.size();
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (offset >= m_data.size()) {
            return 0;
        }
        // Limit size to the smallest of the requested size, the output buffer size and the amount of bytes available in
        // the file starting from offset
        size = std::min<uintmax_t>(size, m_data.size() - offset);
        size = std::min<uintmax_t>(size, output.size());
        std::copy_n(m_data.cbegin() + offset, size, output.begin());
        return size;
    }

private:
    std::vector<uint8> m_data;
};

} // namespace chdview::media
