#include <chdview/core/hash.hpp>

#include <fmt/format.h>
#include <xxh3.h>

#include <algorithm>
#include <iterator>

namespace chdview {

XXH128Hash CalcHash128(const void *input, size_t len, uint64_t seed) {
    const XXH128_hash_t hash = XXH128(input, len, seed);
    XXH128_canonical_t canonicalHash{};
    XXH128_canonicalFromHash(&canonicalHash, hash);

    XXH128Hash out{};
    std::copy_n(canonicalHash.digest, out.size(), out.begin());
    return out;
}

std::string ToString(const XXH128Hash &hash) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    for (uint8_t b : hash) {
        fmt::format_to(inserter, "{:02X}", b);
    }
    return fmt::to_string(buf);
}

std::string ToString(const SHA1Digest &digest) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    for (uint8_t b : digest) {
        fmt::format_to(inserter, "{:02x}", b);
    }
    return fmt::to_string(buf);
}

bool IsEmpty(const SHA1Digest &digest) {
    return std::all_of(digest.begin(), digest.end(), [](uint8_t b) { return b == 0; });
}

} // namespace chdview
