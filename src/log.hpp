#pragma once

// Debug diagnostics, enabled per component through its config's `debug` flag

#include <iostream>
#include <string>

namespace keygate {
namespace detail {

inline void debug_log(bool enabled, const std::string& component, const std::string& message) {
    if (enabled) {
        std::cerr << "[keygate] " << component << ": " << message << std::endl;
    }
}

}  // namespace detail
}  // namespace keygate
