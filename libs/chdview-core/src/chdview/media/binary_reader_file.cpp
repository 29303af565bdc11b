#include <chdview/media/binary_reader/binary_reader_file.hpp>

#include <algorithm>
#include <cerrno>

namespace chdview::media {

FileBinaryReader::FileBinaryReader(std::filesystem::path path, std::error_code &error) {
    error.clear();

    // Try opening the file for read
    m_in = std::ifstream{path, std::ios::binary};
    if (!m_in) {
        error.assign(errno, std::generic_category());
        return;
    }

    // Get the file size
    m_size = std::filesystem::file_size(path, error);
    if (error) {
        m_size = 0;
        return;
    }
}

uintmax_t FileBinaryReader::Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const {
    if (offset >= m_size) {
        return 0;
    }
    // Limit size to the smallest of the requested size, the output buffer size and the amount of bytes available in
    // the file starting from offset
    size = std::min(size, m_size - offset);
    size = std::min<uintmax_t>(size, output.size());

    std::lock_guard lock{m_mutex};
    m_in.clear();
    m_in.seekg(offset, std::ios::beg);
    m_in.read(reinterpret_cast<char *>(output.data()), size);
    return m_in.gcount();
}

} // namespace chdview::media
