#pragma once

#include "coexnet/core/type.hpp"

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: coexnet/kernel/advisory.hpp
// BRIEF: Non-fatal findings returned alongside results
// =============================================================================

namespace coexnet::kernel {

struct Advisory {
    std::string stage;      // e.g. "ModuleDetector"
    std::string operation;  // e.g. "detect_modules"
    std::string message;
    ModuleId module = UNASSIGNED_MODULE;
};

using Advisories = std::vector<Advisory>;

/// @brief Log one WARNING line and keep the advisory.
inline void report(Advisories& out, std::string stage, std::string operation,
                   std::string message, ModuleId module = UNASSIGNED_MODULE) {
    std::fprintf(stderr, "WARNING: %s::%s %s\n", stage.c_str(), operation.c_str(), message.c_str());
    out.push_back(Advisory{std::move(stage), std::move(operation), std::move(message), module});
}

} // namespace coexnet::kernel
