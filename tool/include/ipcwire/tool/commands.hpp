#pragma once

#include <ostream>

#include "ipcwire/net/config.hpp"
#include "ipcwire/tool/options.hpp"

namespace ipcwire::tool
{

    /// Merges the config file (if any) with command line overrides.
    net::NetworkConfig resolve_config(const ToolOptions &options);

    /// Runs the selected command, writing results to `out`. Returns the process
    /// exit code; library errors propagate as exceptions.
    int run_command(const ToolOptions &options, const net::NetworkConfig &config, std::ostream &out);

} // namespace ipcwire::tool
