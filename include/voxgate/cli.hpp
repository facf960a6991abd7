#pragma once

#include "config.hpp"

#include <optional>

namespace voxgate::cli {

    // Resolves `cfg` from an optional JSON config file and command-line overrides.
    // Returns an exit status when the process should stop here (--version, --print-config,
    // bad arguments), or nullopt to carry on.
    std::optional<int> parse_cli(int argc, char** argv, bridge_config& cfg);

}  // namespace voxgate::cli
