#include <chdview/chd/codec/codec_lzma.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <chdview/util/scope_guard.hpp>
#include <chdview/util/size_ops.hpp>

#include <lzma.h>

namespace chdview::chd::codec {

LzmaCodec::LzmaCodec(uint32 hunkBytes)
    : m_dictSize(CalcDictionarySize(hunkBytes)) {}

uint32 LzmaCodec::CalcDictionarySize(uint32 hunkBytes) {
    // Compression level 9 uses a 64 MiB dictionary, reduced to the smallest 2^n or 3*2^(n-1) that covers a hunk
    for (uint32 i = 11; i <= 30; i++) {
        if (hunkBytes <= (2u << i)) {
            return 2u << i;
        }
        if (hunkBytes <= (3u << i)) {
            return 3u << i;
        }
    }
    return 64_MiB;
}

Error LzmaCodec::Decompress(std::span<const uint8> src, std::span<uint8> dst) {
    lzma_options_lzma options{};
    options.dict_size = m_dictSize;
    options.lc = 3;
    options.lp = 0;
    options.pb = 2;
    options.ext_flags = LZMA_LZMA1EXT_ALLOW_EOPM;
    lzma_set_ext_size(options, dst.size());

    lzma_filter filters[2] = {{LZMA_FILTER_LZMA1EXT, &options}, {LZMA_VLI_UNKNOWN, nullptr}};
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_ret ret = lzma_raw_decoder(&strm, filters); ret != LZMA_OK) {
        devlog::warn<grp::codec>("Unable to initialize LZMA decoder: {}", static_cast<int>(ret));
        return Error::DecompressionError;
    }
    util::ScopeGuard sgEndStream{[&] { lzma_end(&strm); }};

    strm.next_in = src.data();
    strm.avail_in = src.size();
    strm.next_out = dst.data();
    strm.avail_out = dst.size();

    const lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
    if (ret != LZMA_STREAM_END) {
        devlog::debug<grp::codec>("LZMA decoding failed: {}", static_cast<int>(ret));
        return Error::DecompressionError;
    }
    if (strm.total_out != dst.size()) {
        devlog::debug<grp::codec>("LZMA produced {} bytes, expected {}", strm.total_out, dst.size());
        return Error::DecompressionError;
    }
    return Error::None;
}

} // namespace chdview::chd::codec
