#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ipcwire/tool/commands.hpp"
#include "ipcwire/tool/options.hpp"
#include "ipcwire/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ipcwire tool " << ipcwire::version() << "\n"
                  << ipcwire::tool::usage(program_name) << "\n";
    }

    void install_logger(const ipcwire::tool::ToolOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (options.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_path->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("ipcwire", sinks.begin(), sinks.end());
        logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    ipcwire::tool::ToolOptions options;
    try
    {
        options = ipcwire::tool::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (options.show_help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        install_logger(options);
        const auto config = ipcwire::tool::resolve_config(options);
        spdlog::debug("ipcwire tool {} (fragment budget {}, version tag '{}')", ipcwire::version(),
                      config.max_fragment_size, config.protocol_version);
        return ipcwire::tool::run_command(options, config, std::cout);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ipcwire-tool failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
