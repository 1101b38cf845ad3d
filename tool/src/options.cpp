#include "ipcwire/tool/options.hpp"

#include <stdexcept>

namespace ipcwire::tool
{

    namespace
    {

        std::optional<Command> command_from_string(std::string_view label)
        {
            if (label == "encode")
            {
                return Command::Encode;
            }
            if (label == "decode")
            {
                return Command::Decode;
            }
            if (label == "inspect")
            {
                return Command::Inspect;
            }
            if (label == "demo")
            {
                return Command::Demo;
            }
            return std::nullopt;
        }

        void check_arity(const ToolOptions &options)
        {
            const auto count = options.arguments.size();
            switch (options.command)
            {
            case Command::Encode:
                if (count != 1)
                {
                    throw std::runtime_error("encode expects exactly one hex string");
                }
                break;
            case Command::Decode:
                if (count == 0)
                {
                    throw std::runtime_error("decode expects at least one fragment");
                }
                break;
            case Command::Inspect:
                if (count != 1)
                {
                    throw std::runtime_error("inspect expects exactly one route");
                }
                break;
            case Command::Demo:
                if (count > 1)
                {
                    throw std::runtime_error("demo takes at most one element count");
                }
                break;
            }
        }

    } // namespace

    std::string usage(std::string_view program_name)
    {
        return "Usage: " + std::string(program_name) +
               " <encode HEX | decode FRAGMENT... | inspect ROUTE | demo [COUNT]>"
               " [--config <FILE>] [--max-size <N>] [--lenient] [--log <FILE>] [--verbose]";
    }

    ToolOptions parse_arguments(int argc, char *argv[])
    {
        ToolOptions options;
        std::optional<Command> command;

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--config requires a file path");
                }
                options.config_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--max-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--max-size requires a value (units per fragment)");
                }
                options.max_fragment_size = static_cast<std::size_t>(std::stoull(argv[index++]));
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                options.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--lenient")
            {
                options.lenient_tokens = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                options.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                options.show_help = true;
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!command)
            {
                command = command_from_string(arg);
                if (!command)
                {
                    throw std::runtime_error("Unknown command: " + arg);
                }
            }
            else
            {
                options.arguments.push_back(arg);
            }
        }

        if (options.show_help)
        {
            return options;
        }
        if (!command)
        {
            throw std::runtime_error("Missing command");
        }
        options.command = *command;
        check_arity(options);
        return options;
    }

} // namespace ipcwire::tool
