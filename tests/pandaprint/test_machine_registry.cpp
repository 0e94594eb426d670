#include <catch2/catch.hpp>

#include "RecordingFakes.hpp"

#include "libpandaprint/Exception.hpp"
#include "pandaprint/Server/MachineRegistry.hpp"

#include <thread>

using namespace PandaPrint;
using namespace PandaPrint::test;

TEST_CASE("Printers are found by name", "[MachineRegistry]") {
    PrinterLog      log;
    MachineRegistry registry({test_printer("p1s"), test_printer("x1c")}, recording_publishers(log));

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains("x1c"));
    REQUIRE(registry.find("x1c").name() == "x1c");
    REQUIRE(&registry.find("p1s") == &registry.find("p1s"));

    REQUIRE_FALSE(registry.contains("X1C"));
    REQUIRE_THROWS_AS(registry.find("X1C"), UnknownDeviceError);
    REQUIRE_THROWS_AS(registry.find(""), UnknownDeviceError);

    // Looking printers up opens nothing.
    REQUIRE(log.publishers == 0);
}

TEST_CASE("Command channels are opened once", "[MachineRegistry]") {
    PrinterLog      log;
    MachineRegistry registry({test_printer("p1s"), test_printer("x1c")}, recording_publishers(log));

    SECTION("Concurrent first use") {
        std::vector<std::thread>       threads;
        std::vector<CommandPublisher*> seen(16, nullptr);
        for (size_t i = 0; i < seen.size(); ++i)
            threads.emplace_back([&registry, &seen, i]() { seen[i] = &registry.find("p1s").mqtt(); });
        for (auto& thread : threads)
            thread.join();

        REQUIRE(log.publishers == 1);
        for (auto* publisher : seen)
            REQUIRE(publisher == seen.front());
        REQUIRE_FALSE(registry.find("x1c").has_mqtt());
    }

    SECTION("Shutdown closes the open channels only, once") {
        registry.find("p1s").mqtt();
        registry.shutdown_all();
        REQUIRE(log.publishers_shut_down == 1);
        REQUIRE_THROWS_AS(registry.find("p1s").mqtt(), RuntimeError);
        REQUIRE_THROWS_AS(registry.find("x1c").mqtt(), RuntimeError);

        registry.shutdown_all();
        REQUIRE(log.publishers_shut_down == 1);
        REQUIRE(log.publishers == 1);
    }
}

TEST_CASE("Factories that fail do not leave a channel behind", "[MachineRegistry]") {
    int             attempts = 0;
    MachineRegistry registry({test_printer()}, [&attempts](const PrinterConfig&) -> std::unique_ptr<CommandPublisher> {
        ++attempts;
        return nullptr;
    });

    REQUIRE_THROWS_AS(registry.find("p1s").mqtt(), RuntimeError);
    REQUIRE_FALSE(registry.find("p1s").has_mqtt());
    REQUIRE_THROWS_AS(registry.find("p1s").mqtt(), RuntimeError);
    REQUIRE(attempts == 2);
}

TEST_CASE("Printer names are unique", "[MachineRegistry]") {
    PrinterLog log;
    REQUIRE_THROWS_AS(MachineRegistry({test_printer("p1s"), test_printer("p1s")}, recording_publishers(log)), ConfigError);
}
