#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "ipcwire/error_codes.hpp"
#include "ipcwire/job.hpp"
#include "ipcwire/net/config.hpp"
#include "ipcwire/net/endpoint_manager.hpp"
#include "ipcwire/net/header.hpp"
#include "ipcwire/net/loopback_transport.hpp"
#include "ipcwire/net/network.hpp"
#include "ipcwire/net/reassembler.hpp"
#include "ipcwire/proto/collections.hpp"
#include "ipcwire/proto/primitive.hpp"
#include "ipcwire/proto/string.hpp"
#include "ipcwire/scheduler.hpp"

using namespace ipcwire;
using namespace ipcwire::net;

namespace
{

    using namespace std::chrono_literals;

    struct Harness
    {
        explicit Harness(NetworkConfig config = {})
            : scheduler(io_context),
              network(transport, scheduler, std::move(config))
        {
        }

        void pump()
        {
            io_context.restart();
            io_context.run();
        }

        void deliver(const Delivery &delivery)
        {
            network.handle_message(delivery.route, delivery.payload).run();
        }

        asio::io_context io_context;
        Scheduler scheduler;
        LoopbackTransport transport;
        Network network;
    };

    template <typename Fn>
    void expect_error(ErrorCode code, Fn &&fn)
    {
        bool thrown = false;
        try
        {
            fn();
        }
        catch (const Error &ex)
        {
            thrown = true;
            assert(ex.code() == code);
        }
        assert(thrown);
    }

    FragmentHeader header_for(const std::string &guid, std::uint32_t index, bool is_final)
    {
        return make_header(guid, index, is_final);
    }

    Job<void> record_steps(std::vector<std::string> &log, std::string name, int steps)
    {
        for (int i = 0; i < steps; ++i)
        {
            log.push_back(name + std::to_string(i));
            co_yield checkpoint;
        }
    }

    Job<void> fail_after_step()
    {
        co_yield checkpoint;
        throw std::runtime_error("job exploded");
    }

    Job<void> throw_plain_int()
    {
        co_yield checkpoint;
        throw 42;
    }

    void test_header_codec()
    {
        const auto guid = generate_guid();
        assert(guid.size() == kGuidLength);
        for (const char ch : guid)
        {
            assert((ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'F'));
        }

        const auto header = make_header(guid, 7, true);
        assert(header.version == kProtocolVersion);
        auto buffer = proto::to_buffer(*header_serializer(), header);
        assert(proto::from_buffer(*header_serializer(), buffer) == header);

        const nlohmann::json json = header;
        assert(json.at("index") == 7);
        assert(json.at("final") == true);
        assert(json.get<FragmentHeader>() == header);
    }

    void test_endpoint_manager()
    {
        EndpointManager endpoints;
        std::vector<int> calls;
        auto make_listener = [&calls](int id)
        {
            return [&calls, id](FragmentHeader, std::string) -> Job<void>
            {
                calls.push_back(id);
                co_return;
            };
        };

        auto first = endpoints.register_listener("chat", make_listener(1));
        auto second = endpoints.register_listener("chat", make_listener(2));
        (void)endpoints.register_listener("other", make_listener(3));
        assert(endpoints.endpoint_count() == 2);

        for (const auto &listener : endpoints.listeners("chat"))
        {
            (*listener)(FragmentHeader{}, "").run();
        }
        assert((calls == std::vector<int>{1, 2}));

        first();
        first();
        assert(endpoints.listeners("chat").size() == 1);
        second();
        assert(!endpoints.has_listeners("chat"));
        assert(endpoints.listeners("chat").empty());
        assert(endpoints.endpoint_count() == 1);

        endpoints.clear();
        assert(endpoints.endpoint_count() == 0);

        Unsubscribe outlived;
        {
            EndpointManager scoped;
            outlived = scoped.register_listener("gone", make_listener(4));
        }
        outlived();
    }

    void test_reassembler_orders()
    {
        Reassembler reassembler;
        assert(!reassembler.accept(header_for("AAAA0001", 2, true), "c"));
        assert(!reassembler.accept(header_for("AAAA0001", 0, false), "a"));
        assert(reassembler.pending() == 1);
        const auto complete = reassembler.accept(header_for("AAAA0001", 1, false), "b");
        assert(complete);
        assert((*complete == std::vector<std::string>{"a", "b", "c"}));
        assert(reassembler.pending() == 0);

        // Partial delivery never completes.
        assert(!reassembler.accept(header_for("AAAA0002", 0, false), "x"));
        assert(!reassembler.accept(header_for("AAAA0002", 1, false), "y"));
        assert(reassembler.pending() == 1);

        // Same index twice: the newer content wins.
        assert(!reassembler.accept(header_for("AAAA0003", 0, false), "old"));
        assert(!reassembler.accept(header_for("AAAA0003", 0, false), "new"));
        const auto replaced = reassembler.accept(header_for("AAAA0003", 1, true), "tail");
        assert(replaced && replaced->front() == "new");

        // Three buffered indices matching the count, but index 1 never arrived.
        assert(!reassembler.accept(header_for("AAAA0004", 0, false), "p"));
        assert(!reassembler.accept(header_for("AAAA0004", 5, false), "q"));
        const auto before = reassembler.pending();
        expect_error(ErrorCode::MissingFragment, [&]
                     { (void)reassembler.accept(header_for("AAAA0004", 2, true), "r"); });
        assert(reassembler.pending() == before - 1);
    }

    void test_reassembler_eviction()
    {
        const auto t0 = Reassembler::Clock::time_point{} + 1h;

        Reassembler timed(ReassemblyPolicy{100ms, 0});
        (void)timed.accept(header_for("00000001", 0, false), "a", t0);
        (void)timed.accept(header_for("00000002", 0, false), "b", t0 + 50ms);
        assert(timed.pending() == 2);
        assert(timed.evict_expired(t0 + 120ms) == 1);
        assert(timed.pending() == 1);

        // Accepting also sweeps expired entries.
        (void)timed.accept(header_for("00000003", 0, false), "c", t0 + 200ms);
        assert(timed.pending() == 1);

        Reassembler bounded(ReassemblyPolicy{0ms, 2});
        (void)bounded.accept(header_for("00000011", 0, false), "a", t0);
        (void)bounded.accept(header_for("00000012", 0, false), "b", t0 + 1ms);
        (void)bounded.accept(header_for("00000013", 0, false), "c", t0 + 2ms);
        assert(bounded.pending() == 2);
        // The oldest entry was dropped, so finishing it starts over.
        assert(!bounded.accept(header_for("00000011", 1, true), "z", t0 + 3ms));
        assert(bounded.evict_expired(t0 + 24h) == 0);

        Reassembler unbounded;
        for (int i = 0; i < 100; ++i)
        {
            (void)unbounded.accept(header_for("guid" + std::to_string(i), 0, false), "x", t0);
        }
        assert(unbounded.evict_expired(t0 + 24h) == 0);
        assert(unbounded.pending() == 100);
    }

    void test_out_of_order_network_delivery()
    {
        NetworkConfig config;
        config.max_fragment_size = 9;
        Harness harness(config);

        std::vector<std::string> received;
        auto unsubscribe = harness.network.listen("chat", proto::string(), [&](const std::string &text)
                                                  { received.push_back(text); });

        harness.network.emit("chat", proto::string(), "abcdefghijkl").run();
        const auto deliveries = harness.transport.take();
        assert(deliveries.size() == 3);
        for (const auto &delivery : deliveries)
        {
            assert(delivery.payload.size() <= 9);
        }

        harness.deliver(deliveries[2]);
        harness.deliver(deliveries[0]);
        assert(received.empty());
        assert(harness.network.pending_messages() == 1);
        harness.deliver(deliveries[1]);
        assert((received == std::vector<std::string>{"abcdefghijkl"}));
        assert(harness.network.pending_messages() == 0);

        // In order gives the same result.
        harness.network.emit("chat", proto::string(), "abcdefghijkl").run();
        for (const auto &delivery : harness.transport.take())
        {
            harness.deliver(delivery);
        }
        assert(received.size() == 2 && received.back() == "abcdefghijkl");
        unsubscribe();
    }

    void test_partial_delivery_does_not_dispatch()
    {
        NetworkConfig config;
        config.max_fragment_size = 9;
        Harness harness(config);

        int calls = 0;
        (void)harness.network.listen("chat", proto::string(), [&](const std::string &)
                                     { ++calls; });
        harness.network.emit("chat", proto::string(), "abcdefghijkl").run();
        const auto deliveries = harness.transport.take();
        assert(deliveries.size() == 3);
        harness.deliver(deliveries[0]);
        harness.deliver(deliveries[1]);
        assert(calls == 0);
        assert(harness.network.pending_messages() == 1);
    }

    void test_fan_out_and_unsubscribe()
    {
        Harness harness;
        int first_calls = 0;
        int second_calls = 0;
        auto first = harness.network.listen("news", proto::int32(), [&](std::int32_t)
                                            { ++first_calls; });
        auto second = harness.network.listen("news", proto::int32(), [&](std::int32_t)
                                             { ++second_calls; });

        harness.network.emit("news", proto::int32(), 42).run();
        for (const auto &delivery : harness.transport.take())
        {
            harness.deliver(delivery);
        }
        assert(first_calls == 1 && second_calls == 1);

        first();
        harness.network.emit("news", proto::int32(), 43).run();
        for (const auto &delivery : harness.transport.take())
        {
            harness.deliver(delivery);
        }
        assert(first_calls == 1 && second_calls == 2);

        second();
        assert(!harness.network.endpoints().has_listeners("news"));
    }

    void test_sum_scenario_on_scheduler()
    {
        Harness harness;
        int sum = -1;
        (void)harness.network.listen("math:sum", proto::array(proto::int32()),
                                     [&](const std::vector<std::int32_t> &numbers)
                                     { sum = std::accumulate(numbers.begin(), numbers.end(), 0); });

        harness.network.send("math:sum", proto::array(proto::int32()), std::vector<std::int32_t>{1, 2, 3, 4, 5});
        harness.pump();
        auto deliveries = harness.transport.take();
        assert(deliveries.size() == 1);

        for (auto &delivery : deliveries)
        {
            harness.network.on_message(std::move(delivery.route), std::move(delivery.payload));
        }
        harness.pump();
        assert(sum == 15);
        assert(harness.scheduler.active_jobs() == 0);
    }

    void test_coroutine_callback()
    {
        Harness harness;
        std::vector<std::string> seen;
        (void)harness.network.listen("log", proto::string(),
                                     [&seen](std::string line) -> Job<void>
                                     {
                                         co_yield checkpoint;
                                         seen.push_back(std::move(line));
                                     });
        harness.network.emit("log", proto::string(), "hello").run();
        for (const auto &delivery : harness.transport.take())
        {
            harness.deliver(delivery);
        }
        assert((seen == std::vector<std::string>{"hello"}));
    }

    void test_listener_failures_are_aggregated()
    {
        Harness harness;
        int healthy_calls = 0;
        (void)harness.network.listen("jobs", proto::int32(), [](std::int32_t)
                                     { throw std::runtime_error("first listener failed"); });
        (void)harness.network.listen("jobs", proto::int32(), [&](std::int32_t)
                                     { ++healthy_calls; });
        (void)harness.network.listen("jobs", proto::int32(), [](std::int32_t)
                                     { throw Error(ErrorCode::InternalError, "third listener failed"); });

        harness.network.emit("jobs", proto::int32(), 1).run();
        const auto deliveries = harness.transport.take();
        assert(deliveries.size() == 1);

        bool thrown = false;
        try
        {
            harness.deliver(deliveries.front());
        }
        catch (const DispatchError &ex)
        {
            thrown = true;
            assert(ex.code() == ErrorCode::ListenerFailed);
            assert(ex.endpoint() == "jobs");
            assert(ex.failures().size() == 2);
        }
        assert(thrown);
        assert(healthy_calls == 1);

        // Through the scheduler the failure reaches the failure handler.
        std::vector<std::string> failed_jobs;
        harness.scheduler.set_failure_handler([&](const std::string &name, std::exception_ptr)
                                              { failed_jobs.push_back(name); });
        harness.network.on_message(deliveries.front().route, deliveries.front().payload);
        harness.pump();
        assert(failed_jobs.size() == 1);
        assert(healthy_calls == 2);
    }

    void test_strict_and_lenient_tokens()
    {
        Harness strict;
        int calls = 0;
        (void)strict.network.listen("chat", proto::string(), [&](const std::string &)
                                    { ++calls; });
        expect_error(ErrorCode::MalformedToken, [&]
                     { strict.network.handle_message("no-separator", "41").run(); });
        expect_error(ErrorCode::MalformedToken, [&]
                     { strict.network.handle_message("(0xZZ):(0x00)", "41").run(); });

        strict.network.emit("chat", proto::string(), "hi").run();
        const auto good = strict.transport.take().front();
        const auto endpoint_token = good.route.substr(0, good.route.find(':'));
        expect_error(ErrorCode::MalformedToken, [&]
                     { strict.network.handle_message(endpoint_token + ":(0x0", good.payload).run(); });
        assert(calls == 0);

        NetworkConfig config;
        config.strict_tokens = false;
        Harness lenient(config);
        (void)lenient.network.listen("chat", proto::string(), [&](const std::string &)
                                     { ++calls; });
        lenient.network.handle_message("no-separator", "41").run();
        lenient.network.handle_message("(0xZZ):(0x00)", "41").run();
        lenient.network.handle_message(endpoint_token + ":(0x0", good.payload).run();
        assert(calls == 0);
        assert(lenient.network.pending_messages() == 0);

        // Well-formed input still flows in lenient mode.
        lenient.network.handle_message(good.route, good.payload).run();
        assert(calls == 1);
    }

    void test_version_mismatch_is_dropped()
    {
        NetworkConfig sender_config;
        sender_config.protocol_version = "mcbe-ipc:v2";
        Harness sender(sender_config);
        sender.network.emit("chat", proto::string(), "old peer").run();
        const auto deliveries = sender.transport.take();

        Harness receiver;
        int calls = 0;
        (void)receiver.network.listen("chat", proto::string(), [&](const std::string &)
                                      { ++calls; });
        for (const auto &delivery : deliveries)
        {
            receiver.deliver(delivery);
        }
        assert(calls == 0);
        assert(receiver.network.pending_messages() == 0);

        NetworkConfig permissive;
        permissive.enforce_version = false;
        Harness tolerant(permissive);
        (void)tolerant.network.listen("chat", proto::string(), [&](const std::string &)
                                      { ++calls; });
        for (const auto &delivery : deliveries)
        {
            tolerant.deliver(delivery);
        }
        assert(calls == 1);
    }

    void test_unknown_endpoint_is_ignored()
    {
        Harness harness;
        harness.network.emit("nobody", proto::string(), "hello?").run();
        for (const auto &delivery : harness.transport.take())
        {
            harness.deliver(delivery);
        }
        assert(harness.network.pending_messages() == 0);
    }

    void test_network_eviction()
    {
        NetworkConfig config;
        config.max_fragment_size = 9;
        config.reassembly_timeout = 50ms;
        Harness harness(config);
        (void)harness.network.listen("chat", proto::string(), [](const std::string &) {});
        harness.network.emit("chat", proto::string(), "abcdefghijkl").run();
        harness.deliver(harness.transport.take().front());
        assert(harness.network.pending_messages() == 1);
        assert(harness.network.evict_expired(Reassembler::Clock::now() + 1s) == 1);
        assert(harness.network.pending_messages() == 0);

        harness.network.close();
        assert(harness.network.endpoints().endpoint_count() == 0);
    }

    void test_scheduler_interleaving()
    {
        asio::io_context io_context;
        Scheduler scheduler(io_context);
        std::vector<std::string> log;
        scheduler.spawn(record_steps(log, "a", 3), "a");
        scheduler.spawn(record_steps(log, "b", 3), "b");
        assert(scheduler.active_jobs() == 2);
        io_context.run();
        assert((log == std::vector<std::string>{"a0", "b0", "a1", "b1", "a2", "b2"}));
        assert(scheduler.active_jobs() == 0);

        std::string failed;
        scheduler.set_failure_handler([&](const std::string &name, std::exception_ptr error)
                                      {
                                          failed = name;
                                          assert(error);
                                      });
        scheduler.spawn(fail_after_step(), "doomed");
        io_context.restart();
        io_context.run();
        assert(failed == "doomed");
        assert(scheduler.active_jobs() == 0);

        // Exceptions outside std::exception still count as failures.
        failed.clear();
        scheduler.spawn(throw_plain_int(), "odd");
        io_context.restart();
        io_context.run();
        assert(failed == "odd");
        assert(scheduler.active_jobs() == 0);
    }

    void test_config()
    {
        const auto partial = nlohmann::json{{"max_fragment_size", 512}, {"strict_tokens", false}}.get<NetworkConfig>();
        assert(partial.max_fragment_size == 512);
        assert(!partial.strict_tokens);
        assert(partial.enforce_version);
        assert(partial.protocol_version == kProtocolVersion);
        assert(partial.reassembly_timeout == 0ms);

        NetworkConfig custom;
        custom.reassembly_timeout = 1500ms;
        custom.max_pending_messages = 8;
        const nlohmann::json json = custom;
        assert(json.at("reassembly_timeout_ms") == 1500);
        const auto restored = json.get<NetworkConfig>();
        assert(restored.reassembly_policy().timeout == 1500ms);
        assert(restored.reassembly_policy().max_pending == 8);

        NetworkConfig tiny;
        tiny.max_fragment_size = 2;
        expect_error(ErrorCode::InvalidArgument, [&]
                     { tiny.validate(); });

        asio::io_context io_context;
        Scheduler scheduler(io_context);
        LoopbackTransport transport;
        expect_error(ErrorCode::InvalidArgument, [&]
                     { Network rejected(transport, scheduler, tiny); });

        const auto path = std::filesystem::temp_directory_path() / "ipcwire_test_config.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"max_fragment_size": 64, "protocol_version": "custom:v1", "max_pending_messages": 4})";
        }
        const auto loaded = load_network_config(path);
        assert(loaded.max_fragment_size == 64);
        assert(loaded.protocol_version == "custom:v1");
        assert(loaded.max_pending_messages == 4);
        std::filesystem::remove(path);

        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ not json";
        }
        expect_error(ErrorCode::InvalidArgument, [&]
                     { (void)load_network_config(path); });
        std::filesystem::remove(path);

        expect_error(ErrorCode::InvalidArgument, [&]
                     { (void)load_network_config(path); });
    }

} // namespace

void run_network_component_tests()
{
    test_header_codec();
    test_endpoint_manager();
    test_reassembler_orders();
    test_reassembler_eviction();
    test_out_of_order_network_delivery();
    test_partial_delivery_does_not_dispatch();
    test_fan_out_and_unsubscribe();
    test_sum_scenario_on_scheduler();
    test_coroutine_callback();
    test_listener_failures_are_aggregated();
    test_strict_and_lenient_tokens();
    test_version_mismatch_is_dropped();
    test_unknown_endpoint_is_ignored();
    test_network_eviction();
    test_scheduler_interleaving();
    test_config();
}
