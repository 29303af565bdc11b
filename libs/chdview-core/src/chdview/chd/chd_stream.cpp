#include <chdview/chd/chd_stream.hpp>

#include <chdview/util/dev_assert.hpp>

#include <limits>

namespace chdview::chd {

Stream::Stream(std::shared_ptr<Image> image)
    : m_image(std::move(image)) {
    CHDVIEW_DEV_ASSERT(m_image != nullptr);
}

Error Stream::Read(std::span<uint8> output, uint64 &bytesRead) {
    bytesRead = 0;
    uint64 count = 0;
    if (Error error = m_image->ReadBytes(m_position, output, count); error != Error::None) {
        return error;
    }
    m_position += count;
    bytesRead = count;
    return Error::None;
}

Error Stream::Seek(sint64 offset, SeekOrigin origin, uint64 &position) {
    const uint64 size = Size();

    uint64 base;
    switch (origin) {
    case SeekOrigin::Begin: base = 0; break;
    case SeekOrigin::Current: base = m_position; break;
    case SeekOrigin::End: base = size; break;
    default: return Error::InvalidSeek;
    }

    uint64 target;
    if (offset >= 0) {
        const uint64 delta = static_cast<uint64>(offset);
        if (delta > std::numeric_limits<uint64>::max() - base) {
            return Error::InvalidSeek;
        }
        target = base + delta;
    } else {
        // Negate in unsigned arithmetic so that INT64_MIN is handled
        const uint64 delta = ~static_cast<uint64>(offset) + 1;
        if (delta > base) {
            return Error::InvalidSeek;
        }
        target = base - delta;
    }

    if (target > size) {
        return Error::InvalidSeek;
    }
    m_position = target;
    position = target;
    return Error::None;
}

uint64 Stream::Write(std::span<const uint8> data) {
    return data.size();
}

} // namespace chdview::chd
