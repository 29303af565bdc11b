#pragma once

/**
@file
@brief chdview version strings, assembled from the definitions passed in by the build.
*/

#if chdview_DEV_BUILD
    #define chdview_FULL_VERSION chdview_VERSION "-dev"
#else
    #define chdview_FULL_VERSION chdview_VERSION
#endif

namespace chdview::version {

/// @brief "<major>.<minor>.<patch>[-<prerelease>][+<build>]", with a `-dev` suffix on development builds.
inline constexpr auto fullstring = chdview_FULL_VERSION;

} // namespace chdview::version
