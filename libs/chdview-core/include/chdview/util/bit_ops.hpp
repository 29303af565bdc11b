#pragma once

#include <chdview/core/types.hpp>

#include "inline.hpp"

#include <bit>
#include <climits>
#include <concepts>
#include <cstddef>
#include <utility>

namespace bit {

// Returns the number of bits needed to represent x.
template <std::unsigned_integral T>
FORCE_INLINE constexpr uint32 bit_length(T x) {
    return static_cast<uint32>(std::bit_width(x));
}

namespace detail {

    template <class T, std::size_t... N>
    constexpr T byte_swap_impl(T value, std::index_sequence<N...>) {
        return ((((value >> (N * CHAR_BIT)) & (T)(unsigned char)(-1)) << ((sizeof(T) - 1 - N) * CHAR_BIT)) | ...);
    };

} // namespace detail

// Byte swaps the given value
template <std::unsigned_integral T>
constexpr T byte_swap(T value) {
    return detail::byte_swap_impl<T>(value, std::make_index_sequence<sizeof(T)>{});
}

} // namespace bit
