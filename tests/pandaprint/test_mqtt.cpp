#include <catch2/catch.hpp>

#include "FakeMqttBroker.hpp"
#include "test_utils.hpp"

#include "pandaprint/Utils/MqttClient.hpp"

#include <atomic>

using namespace PandaPrint;
using namespace PandaPrint::test;

TEST_CASE("MQTT client", "[MQTT]") {
    FakeMqttBroker broker;
    MqttClient     client("127.0.0.1", broker.port(), "bblp", "5678");

    std::atomic<int> connected{0};
    client.addConnectEventHandler([&connected]() { ++connected; });

    SECTION("Messages published before the session is up are delivered") {
        client.start();
        client.publish("device/SERIAL/request", {{"print", {{"command", "project_file"}}}});

        REQUIRE(broker.wait_for_publishes(1));
        const auto publish = broker.publishes().front();
        REQUIRE(publish.topic == "device/SERIAL/request");
        REQUIRE(nlohmann::json::parse(publish.payload) == nlohmann::json{{"print", {{"command", "project_file"}}}});
        REQUIRE(publish.qos == 0);

        const auto connect = broker.connects().front();
        REQUIRE(connect.client_id == client.client_id());
        REQUIRE(connect.client_id.rfind("pandaprint-", 0) == 0);
        REQUIRE(connect.username == "bblp");
        REQUIRE(connect.password == "5678");
        REQUIRE(connect.keepalive == 60);
        REQUIRE(connect.clean_session);
        REQUIRE(client.is_connected());
        REQUIRE(connected == 1);
    }

    SECTION("Shutdown disconnects and is idempotent") {
        client.start();
        REQUIRE(wait_until([&]() { return client.is_connected(); }));
        client.shutdown();
        REQUIRE(broker.wait_for_disconnects(1));
        REQUIRE_FALSE(client.is_connected());
        REQUIRE_NOTHROW(client.shutdown());

        client.publish("device/SERIAL/request", {{"print", {}}});
        REQUIRE(broker.publishes().empty());
    }

    SECTION("Messages keep their order") {
        client.start();
        for (int i = 0; i < 5; ++i)
            client.publish("device/SERIAL/request", {{"n", i}});

        REQUIRE(broker.wait_for_publishes(5));
        const auto publishes = broker.publishes();
        for (int i = 0; i < 5; ++i)
            REQUIRE(nlohmann::json::parse(publishes[i].payload).at("n") == i);
    }

    SECTION("Shutting down a client that never started") {
        REQUIRE_NOTHROW(client.shutdown());
        REQUIRE(broker.connects().empty());
        REQUIRE_FALSE(client.is_connected());
    }

    SECTION("The client reconnects after the connection drops") {
        client.start();
        REQUIRE(broker.wait_for_connects(1));
        REQUIRE(wait_until([&]() { return client.is_connected(); }));

        std::atomic<int> errors{0};
        client.addErrorEventHandler([&errors](std::string) { ++errors; });
        broker.drop_clients();

        REQUIRE(broker.wait_for_connects(2));
        REQUIRE(wait_until([&]() { return client.is_connected(); }));
        REQUIRE(errors >= 1);

        client.publish("device/SERIAL/request", {{"n", 2}});
        REQUIRE(broker.wait_for_publishes(1));
        REQUIRE(broker.publishes().front().payload == R"({"n":2})");
    }
}

TEST_CASE("MQTT client without a broker", "[MQTT]") {
    unsigned short port;
    {
        boost::asio::io_context        ioc;
        boost::asio::ip::tcp::acceptor closed(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
        port = closed.local_endpoint().port();
    }
    MqttClient client("127.0.0.1", port, "bblp", "5678");

    std::atomic<int> errors{0};
    client.addErrorEventHandler([&errors](std::string) { ++errors; });
    client.start();
    // Publishing never blocks on the missing connection.
    client.publish("device/SERIAL/request", {{"queued", true}});

    REQUIRE(wait_until([&]() { return errors >= 1; }));
    REQUIRE_FALSE(client.is_connected());
    REQUIRE_NOTHROW(client.shutdown());
}

TEST_CASE("MQTT client with refused credentials", "[MQTT]") {
    FakeMqttBroker broker(5);
    MqttClient     client("127.0.0.1", broker.port(), "bblp", "wrong");

    std::atomic<int> errors{0};
    client.addErrorEventHandler([&errors](std::string) { ++errors; });
    client.start();
    client.publish("device/SERIAL/request", {{"queued", true}});

    REQUIRE(broker.wait_for_connects(1));
    REQUIRE(wait_until([&]() { return errors >= 1; }));
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(broker.publishes().empty());

    // Accepted on the next attempt, the queued message goes out.
    broker.set_connack_code(0);
    REQUIRE(broker.wait_for_publishes(1, std::chrono::seconds(15)));
    REQUIRE(client.is_connected());
}
