#pragma once

#include "chd_image.hpp"

#include <chdview/media/binary_reader/binary_reader.hpp>

#include <memory>

namespace chdview::chd {

// Implementation of IBinaryReader that reads the decoded contents of a CHD image.
// Decode failures are reported as short reads.
class ImageBinaryReader final : public media::IBinaryReader {
public:
    // Initializes a reader over the logical data of an opened image.
    ImageBinaryReader(std::shared_ptr<Image> image)
        : m_image(std::move(image)) {}

    ImageBinaryReader(const ImageBinaryReader &) = default;
    ImageBinaryReader(ImageBinaryReader &&) = default;

    ImageBinaryReader &operator=(const ImageBinaryReader &) = default;
    ImageBinaryReader &operator=(ImageBinaryReader &&) = default;

    uintmax_t Size() const final {
        return m_image->LogicalSize();
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (size < output.size()) {
            output = output.first(size);
        }
        uint64 bytesRead = 0;
        if (m_image->ReadBytes(offset, output, bytesRead) != Error::None) {
            return 0;
        }
        return bytesRead;
    }

private:
    std::shared_ptr<Image> m_image;
};

} // namespace chdview::chd
