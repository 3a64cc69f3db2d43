#pragma once

#include <tessera/util/dev_log.hpp>

namespace tessera::cell::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   loader

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Cell";
};

struct loader : public base {
    static constexpr std::string_view name = "Cell-Loader";
};

} // namespace tessera::cell::grp
