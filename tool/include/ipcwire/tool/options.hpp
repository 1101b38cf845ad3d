#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ipcwire::tool
{

    enum class Command
    {
        Encode,
        Decode,
        Inspect,
        Demo
    };

    struct ToolOptions
    {
        Command command{Command::Demo};
        std::vector<std::string> arguments;
        std::optional<std::filesystem::path> config_path;
        std::optional<std::size_t> max_fragment_size;
        std::optional<std::filesystem::path> log_path;
        bool lenient_tokens{false};
        bool verbose{false};
        bool show_help{false};
    };

    std::string usage(std::string_view program_name);

    /// Throws std::runtime_error with a user-facing message on bad input.
    ToolOptions parse_arguments(int argc, char *argv[]);

} // namespace ipcwire::tool
