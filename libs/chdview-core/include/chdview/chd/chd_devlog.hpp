#pragma once

#include <chdview/util/dev_log.hpp>

#include <string_view>

namespace chdview::chd::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   map
//   codec
//     flac
//   cache

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "CHD";
};

struct map : public base {
    static constexpr std::string_view name = "CHD-Map";
};

struct codec : public base {
    static constexpr std::string_view name = "CHD-Codec";
};

struct flac : public codec {
    static constexpr devlog::Level level = devlog::level::info;
    static constexpr std::string_view name = "FLAC";
};

struct cache : public base {
    static constexpr devlog::Level level = devlog::level::info;
    static constexpr std::string_view name = "CHD-Cache";
};

} // namespace chdview::chd::grp
