#include <chdview/chd/codec/codec_deflate.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/util/scope_guard.hpp>

#include <zlib.h>

namespace chdview::chd::codec {

Error DeflateCodec::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    z_stream z{};
    if (inflateInit2(&z, -MAX_WBITS) != Z_OK) {
        devlog::warn<grp::codec>("Unable to initialize inflate: {}", z.msg ? z.msg : "?");
        return Error::DecompressionError;
    }
    util::ScopeGuard sgEndInflate{[&] { inflateEnd(&z); }};

    z.next_in = const_cast<Bytef *>(src.data());
    z.avail_in = static_cast<uInt>(src.size());
    z.next_out = dst.data();
    z.avail_out = static_cast<uInt>(dst.size());

    const int status = inflate(&z, Z_FINISH);
    if (status != Z_STREAM_END && status != Z_OK && status != Z_BUF_ERROR) {
        devlog::debug<grp::codec>("inflate: {} [{}]", z.msg ? z.msg : "error", status);
        return Error::DecompressionError;
    }
    if (z.total_out != dst.size()) {
        devlog::debug<grp::codec>("inflate produced {} bytes, expected {}", z.total_out, dst.size());
        return Error::DecompressionError;
    }
    return Error::None;
}

} // namespace chdview::chd::codec
