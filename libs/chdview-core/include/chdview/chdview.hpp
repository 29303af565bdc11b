#pragma once

/**
@file
@brief Includes the public API of the CHD decoder.
*/

#include <chdview/chd/chd_error.hpp>
#include <chdview/chd/chd_header.hpp>
#include <chdview/chd/chd_image.hpp>
#include <chdview/chd/chd_metadata.hpp>
#include <chdview/chd/chd_stream.hpp>
#include <chdview/chd/hunk_map.hpp>
#include <chdview/chd/image_binary_reader.hpp>

#include <chdview/media/binary_reader/binary_reader_impl.hpp>

#include <chdview/core/configuration.hpp>
#include <chdview/core/hash.hpp>

#include <chdview/version.hpp>
