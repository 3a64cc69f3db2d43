#pragma once

#include <tessera/util/dev_log.hpp>

namespace tessera::io::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   handle
//   seek
//   registry
//   transport

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "IO";
};

struct handle : public base {
    static constexpr std::string_view name = "IO-Handle";
};

struct seek : public base {
    // static constexpr devlog::Level level = devlog::level::trace;
    static constexpr std::string_view name = "IO-Seek";
};

struct registry : public base {
    static constexpr std::string_view name = "IO-Registry";
};

struct transport : public base {
    static constexpr std::string_view name = "IO-Transport";
};

} // namespace tessera::io::grp
