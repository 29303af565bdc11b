#pragma once

/**
@file
@brief Utilities for dealing with memory blocks, including endianness-aware reads/writes of the odd-sized integers
found in CHD headers and maps.
*/

#include <chdview/core/types.hpp>

#include "bit_ops.hpp"
#include "inline.hpp"

#include <bit>
#include <concepts>
#include <cstring>

namespace util {

/// @brief Reads a big-endian integer from the given pointer.
///
/// The pointer does not need to be aligned.
///
/// @tparam T the integer type
/// @param[in] data the pointer to the data to read
/// @return the value at `data` reinterpreted as a big-endian integer of type `T`
template <std::integral T>
[[nodiscard]] FORCE_INLINE T ReadBE(const void *data) {
    T value;
    std::memcpy(&value, data, sizeof(T));
    if constexpr (std::endian::native == std::endian::little) {
        value = static_cast<T>(bit::byte_swap(static_cast<std::make_unsigned_t<T>>(value)));
    }
    return value;
}

/// @brief Write a big-endian integer to the given pointer.
///
/// The pointer does not need to be aligned.
///
/// @tparam T the integer type
/// @param[out] data the pointer to the data to write
/// @param[in] value the value to write at `data` in big-endian order
template <std::integral T>
FORCE_INLINE void WriteBE(void *data, T value) {
    if constexpr (std::endian::native == std::endian::little) {
        value = static_cast<T>(bit::byte_swap(static_cast<std::make_unsigned_t<T>>(value)));
    }
    std::memcpy(data, &value, sizeof(T));
}

/// @brief Reads a big-endian integer of `numBytes` bytes (up to 8) from the given pointer.
///
/// Used for the 24-bit and 48-bit fields of CHD map entries.
///
/// @param[in] data the pointer to the data to read
/// @param[in] numBytes the number of bytes to read
/// @return the zero-extended big-endian value
[[nodiscard]] FORCE_INLINE constexpr uint64 ReadBEN(const uint8 *data, uint32 numBytes) {
    uint64 result = 0;
    while (numBytes--) {
        result = (result << 8ull) | *data++;
    }
    return result;
}

/// @brief Writes the lowest `numBytes` bytes (up to 8) of `value` in big-endian order.
/// @param[out] data the pointer to the data to write
/// @param[in] value the value to write
/// @param[in] numBytes the number of bytes to write
FORCE_INLINE constexpr void WriteBEN(uint8 *data, uint64 value, uint32 numBytes) {
    data += numBytes;
    while (numBytes--) {
        *--data = static_cast<uint8>(value);
        value >>= 8ull;
    }
}

/// @brief Write a little-endian integer to the given pointer.
/// @tparam T the integer type
/// @param[out] data the pointer to the data to write
/// @param[in] value the value to write at `data` in little-endian order
template <std::integral T>
FORCE_INLINE void WriteLE(void *data, T value) {
    if constexpr (std::endian::native == std::endian::big) {
        value = static_cast<T>(bit::byte_swap(static_cast<std::make_unsigned_t<T>>(value)));
    }
    std::memcpy(data, &value, sizeof(T));
}

} // namespace util
