#pragma once

/**
@file
@brief MSB-first bitstream reader used by the map and Huffman decoders.
*/

#include <chdview/util/inline.hpp>

#include <chdview/core/types.hpp>

#include <concepts>
#include <cstddef>
#include <span>

namespace chdview::chd {

/// @brief Reads variable-width bit fields from a byte buffer, most significant bit first.
///
/// The reader holds a view of the buffer and a bit cursor. It is a plain value type: copy it to save a position and
/// assign it back to restart from there.
///
/// Peeking past the end of the buffer yields zero bits, which lets prefix-code decoders look up a fixed number of bits
/// near the end of the stream. Consuming bits past the end always fails and leaves the cursor unchanged.
class BitReader {
public:
    BitReader() = default;

    /// @brief Creates a reader over the given buffer.
    /// @param[in] data the buffer to read from. Must outlive the reader.
    explicit BitReader(std::span<const uint8> data)
        : m_data(data) {}

    /// @brief Returns the next `numBits` bits (0 to 32) without advancing the cursor.
    ///
    /// Bits past the end of the buffer read as zero.
    [[nodiscard]] uint32 Peek(uint32 numBits) const;

    /// @brief Reads the next `numBits` bits (0 to 32) and advances the cursor.
    /// @param[in] numBits the number of bits to read
    /// @param[out] value receives the bits as an unsigned integer
    /// @return `false` if fewer than `numBits` bits remain, in which case neither the cursor nor `value` are modified
    template <std::unsigned_integral T>
    [[nodiscard]] FORCE_INLINE bool Read(uint32 numBits, T &value) {
        if (numBits > BitsRemaining()) {
            return false;
        }
        value = static_cast<T>(Peek(numBits));
        m_bitPos += numBits;
        return true;
    }

    /// @brief Advances the cursor by `numBits` bits.
    /// @return `false` if fewer than `numBits` bits remain, in which case the cursor is not modified
    [[nodiscard]] bool Skip(uint64 numBits);

    /// @brief Returns the number of bits left in the buffer.
    uint64 BitsRemaining() const {
        return TotalBits() - m_bitPos;
    }

    /// @brief Returns the current cursor position in bits.
    uint64 BitPosition() const {
        return m_bitPos;
    }

private:
    std::span<const uint8> m_data;
    uint64 m_bitPos = 0;

    uint64 TotalBits() const {
        return static_cast<uint64>(m_data.size()) * 8u;
    }
};

} // namespace chdview::chd
