#include "ipcwire/tool/commands.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/encoding/packet_encoder.hpp"
#include "ipcwire/encoding/text.hpp"
#include "ipcwire/encoding/token_codec.hpp"
#include "ipcwire/error_codes.hpp"
#include "ipcwire/net/header.hpp"
#include "ipcwire/net/loopback_transport.hpp"
#include "ipcwire/net/network.hpp"
#include "ipcwire/proto/collections.hpp"
#include "ipcwire/proto/string.hpp"
#include "ipcwire/scheduler.hpp"

namespace ipcwire::tool
{

    namespace
    {

        constexpr const char *kDemoEndpoint = "ipcwire:demo";
        constexpr std::int32_t kDefaultDemoCount = 5;

        ByteBuffer parse_hex(const std::string &text)
        {
            if (text.size() % 2 != 0)
            {
                throw Error(ErrorCode::InvalidArgument, "hex input must have an even number of digits");
            }
            ByteBuffer buffer(text.size() / 2 + 1);
            for (std::size_t i = 0; i < text.size(); i += 2)
            {
                const int high = encoding::hex_value(text[i]);
                const int low = encoding::hex_value(text[i + 1]);
                if (high < 0 || low < 0)
                {
                    throw Error(ErrorCode::InvalidArgument, "invalid hex digit near offset " + std::to_string(i));
                }
                buffer.write_byte(static_cast<std::uint8_t>((high << 4) | low));
            }
            return buffer;
        }

        int run_encode(const ToolOptions &options, const net::NetworkConfig &config, std::ostream &out)
        {
            const auto buffer = parse_hex(options.arguments.front());
            const auto fragments = encoding::encode_packets(buffer, config.max_fragment_size).run();
            for (const auto &fragment : fragments)
            {
                out << fragment << '\n';
            }
            return EXIT_SUCCESS;
        }

        int run_decode(const ToolOptions &options, std::ostream &out)
        {
            const auto buffer = encoding::decode_packets(options.arguments).run();
            out << encoding::to_hex(buffer.view()) << '\n';
            return EXIT_SUCCESS;
        }

        int run_inspect(const ToolOptions &options, std::ostream &out)
        {
            const auto &route = options.arguments.front();
            const auto separator = route.find(':');
            if (separator == std::string::npos)
            {
                throw Error(ErrorCode::MalformedToken, "route '" + route + "' has no ':' separator");
            }
            auto endpoint_buffer = encoding::decode_token(route.substr(0, separator)).run();
            auto header_buffer = encoding::decode_token(route.substr(separator + 1)).run();

            nlohmann::json json = {
                {"endpoint", proto::from_buffer(*proto::string(), endpoint_buffer)},
                {"header", proto::from_buffer(*net::header_serializer(), header_buffer)},
            };
            out << json.dump(2) << '\n';
            return EXIT_SUCCESS;
        }

        int run_demo(const ToolOptions &options, const net::NetworkConfig &config, std::ostream &out)
        {
            const auto count = options.arguments.empty()
                                   ? kDefaultDemoCount
                                   : static_cast<std::int32_t>(std::stol(options.arguments.front()));
            if (count < 0)
            {
                throw Error(ErrorCode::InvalidArgument, "demo count must not be negative");
            }
            std::vector<std::int32_t> values(static_cast<std::size_t>(count));
            std::iota(values.begin(), values.end(), 1);

            asio::io_context io_context;
            Scheduler scheduler(io_context);
            net::LoopbackTransport transport;
            net::Network network(transport, scheduler, config);

            std::int64_t sum = 0;
            std::size_t received = 0;
            auto unsubscribe = network.listen(kDemoEndpoint, proto::array(proto::int32()),
                                              [&](const std::vector<std::int32_t> &numbers)
                                              {
                                                  sum = std::accumulate(numbers.begin(), numbers.end(), std::int64_t{0});
                                                  ++received;
                                              });

            network.send(kDemoEndpoint, proto::array(proto::int32()), values);
            io_context.run();

            auto deliveries = transport.take();
            spdlog::info("Demo message split into {} fragment(s); replaying in reverse order", deliveries.size());
            std::reverse(deliveries.begin(), deliveries.end());
            for (auto &delivery : deliveries)
            {
                network.on_message(std::move(delivery.route), std::move(delivery.payload));
            }
            io_context.restart();
            io_context.run();
            unsubscribe();

            if (received != 1)
            {
                out << "message was not reassembled\n";
                return EXIT_FAILURE;
            }
            out << "fragments: " << deliveries.size() << '\n'
                << "sum: " << sum << '\n';
            return EXIT_SUCCESS;
        }

    } // namespace

    net::NetworkConfig resolve_config(const ToolOptions &options)
    {
        net::NetworkConfig config;
        if (options.config_path)
        {
            config = net::load_network_config(*options.config_path);
        }
        if (options.max_fragment_size)
        {
            config.max_fragment_size = *options.max_fragment_size;
        }
        if (options.lenient_tokens)
        {
            config.strict_tokens = false;
        }
        config.validate();
        return config;
    }

    int run_command(const ToolOptions &options, const net::NetworkConfig &config, std::ostream &out)
    {
        switch (options.command)
        {
        case Command::Encode:
            return run_encode(options, config, out);
        case Command::Decode:
            return run_decode(options, out);
        case Command::Inspect:
            return run_inspect(options, out);
        case Command::Demo:
            return run_demo(options, config, out);
        }
        return EXIT_FAILURE;
    }

} // namespace ipcwire::tool
