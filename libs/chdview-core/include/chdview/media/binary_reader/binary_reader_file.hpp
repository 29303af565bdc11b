#pragma once

#include "binary_reader.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <system_error>

namespace chdview::media {

// Implementation of IBinaryReader backed by a file.
// Reads are serialized with a mutex since they share the stream's file pointer.
class FileBinaryReader final : public IBinaryReader {
public:
    // Initializes a file content pointing to no file.
    FileBinaryReader() = default;

    // Initializes a file content pointing to the specified file.
    // If any errors occur while opening the file, initializes an empty file content and returns the error in the
    // provided std::error_code object.
    FileBinaryReader(std::filesystem::path path, std::error_code &error);

    FileBinaryReader(const FileBinaryReader &) = delete;
    FileBinaryReader(FileBinaryReader &&) = delete;

    FileBinaryReader &operator=(const FileBinaryReader &) = delete;
    FileBinaryReader &operator=(FileBinaryReader &&) = delete;

    uintmax_t Size() const final {
        return m_size;
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final;

private:
    mutable std::mutex m_mutex;
    mutable std::ifstream m_in;
    uintmax_t m_size = 0;
};

} // namespace chdview::media
