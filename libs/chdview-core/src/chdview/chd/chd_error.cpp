#include <chdview/chd/chd_error.hpp>

namespace chdview::chd {

std::string_view ToString(Error error) {
    switch (error) {
    case Error::None: return "no error";
    case Error::FormatError: return "invalid CHD format";
    case Error::UnsupportedVersion: return "unsupported CHD version";
    case Error::MapCorrupt: return "corrupt hunk map";
    case Error::InvalidHuffmanTable: return "invalid Huffman table";
    case Error::TruncatedStream: return "truncated bitstream";
    case Error::UnknownCompressor: return "unknown or unsupported compressor";
    case Error::DecompressionError: return "decompression error";
    case Error::ChecksumMismatch: return "hunk checksum mismatch";
    case Error::CyclicReference: return "cyclic self-hunk reference";
    case Error::CyclicParentChain: return "cyclic or too deep parent chain";
    case Error::MissingParent: return "parent image required but not attached";
    case Error::ParentMismatch: return "parent image SHA-1 mismatch";
    case Error::OutOfBounds: return "hunk data out of container bounds";
    case Error::HunkOutOfRange: return "hunk index out of range";
    case Error::InvalidSeek: return "invalid seek position";
    case Error::ReadError: return "read error";
    case Error::MetadataNotFound: return "metadata not found";
    }
    return "unknown error";
}

} // namespace chdview::chd
