#pragma once

/**
@file
@brief Defines `chdview::chd::Stream`, a seekable byte stream over the decoded contents of an image.
*/

#include "chd_error.hpp"
#include "chd_image.hpp"

#include <chdview/core/types.hpp>

#include <memory>
#include <span>

namespace chdview::chd {

/// @brief Reference point for `Stream::Seek`.
enum class SeekOrigin : uint8 { Begin, Current, End };

/// @brief A read-only, seekable byte stream over the logical data of an image.
///
/// The cursor ranges over `[0, Size()]`. Each stream has its own cursor; any number of streams may share one image.
/// A single stream must not be used by more than one thread at a time.
class Stream {
public:
    /// @brief Creates a stream positioned at the start of the image.
    explicit Stream(std::shared_ptr<Image> image);

    /// @brief Reads up to `output.size()` bytes from the current position and advances the cursor.
    ///
    /// Returns fewer bytes than requested only at the end of the data. On failure no bytes are reported and the cursor
    /// is left unchanged.
    ///
    /// @param[out] output receives the data
    /// @param[out] bytesRead receives the number of bytes read
    Error Read(std::span<uint8> output, uint64 &bytesRead);

    /// @brief Moves the cursor.
    ///
    /// @param[in] offset the offset relative to `origin`
    /// @param[in] origin the reference point
    /// @param[out] position receives the new position
    /// @return `InvalidSeek` if the target lies outside `[0, Size()]`; the cursor is left unchanged
    Error Seek(sint64 offset, SeekOrigin origin, uint64 &position);

    /// @brief Accepts a write without modifying anything.
    ///
    /// The image is read-only: neither its data nor the cursor change.
    ///
    /// @return the number of bytes reported as written, which is always `data.size()`
    uint64 Write(std::span<const uint8> data);

    uint64 Position() const {
        return m_position;
    }

    uint64 Size() const {
        return m_image->LogicalSize();
    }

    const std::shared_ptr<Image> &GetImage() const {
        return m_image;
    }

private:
    std::shared_ptr<Image> m_image;
    uint64 m_position = 0;
};

} // namespace chdview::chd
