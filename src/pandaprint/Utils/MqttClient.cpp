#include "MqttClient.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

#include <algorithm>
#include <random>

#include <boost/asio/post.hpp>

namespace PandaPrint {

namespace {

// How long a shutdown waits for buffered messages to go out.
const std::chrono::seconds DISCONNECT_GRACE{5};
const std::chrono::seconds KEEP_ALIVE{60};

std::string make_client_id()
{
    std::random_device              rd;
    std::uniform_int_distribution<> hex(0, 15);
    std::string                     id = "pandaprint-";
    for (int i = 0; i < 12; ++i)
        id.push_back("0123456789abcdef"[hex(rd)]);
    return id;
}

std::string server_uri(const std::string& host, unsigned short port)
{
    const std::string bracketed = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return "ssl://" + bracketed + ":" + std::to_string(port);
}

} // namespace

void MqttClient::ConnectListener::on_failure(const mqtt::token& tok)
{
    m_owner.fail((boost::format("connection refused, return code %1%") % tok.get_return_code()).str());
}

void MqttClient::ConnectListener::on_success(const mqtt::token&) { m_owner.onConnected("connect"); }

MqttClient::MqttClient(const std::string& host, unsigned short port, const std::string& username, const std::string& password)
    : m_host(host)
    , m_port(port)
    , m_client_id(make_client_id())
    , m_listener(*this)
    , m_work(net::make_work_guard(m_ioc))
    , m_reconnect_timer(m_ioc)
{
    // The printers use self signed certificates.
    auto ssl = mqtt::ssl_options_builder().enable_server_cert_auth(false).verify(false).finalize();

    m_conn_opts = mqtt::connect_options_builder()
                      .user_name(username)
                      .password(password)
                      .keep_alive_interval(KEEP_ALIVE)
                      .clean_session(true)
                      .mqtt_version(MQTTVERSION_3_1_1)
                      .automatic_reconnect(MIN_RECONNECT_DELAY, MAX_RECONNECT_DELAY)
                      .ssl(std::move(ssl))
                      .finalize();

    // Messages published while disconnected wait in a bounded buffer, the oldest dropped first.
    mqtt::create_options create_opts(MQTTVERSION_3_1_1, static_cast<int>(OUTBOX_LIMIT));
    create_opts.set_send_while_disconnected(true, true);
    create_opts.set_delete_oldest_messages(true);

    try {
        m_client = std::make_unique<mqtt::async_client>(server_uri(host, port), m_client_id, create_opts);
    } catch (const mqtt::exception& e) {
        throw IOError((boost::format("Cannot create MQTT client for %1%:%2%: %3%") % host % port % e.what()).str());
    }

    m_client->set_connected_handler([this](const std::string& cause) { onConnected(cause); });
    m_client->set_connection_lost_handler([this](const std::string& cause) { onConnectionLost(cause); });
}

MqttClient::~MqttClient()
{
    shutdown();
    m_client.reset();
}

void MqttClient::start()
{
    if (m_started.exchange(true) || m_stopped.load())
        return;

    m_worker = std::thread([this]() { m_ioc.run(); });
    net::post(m_ioc, [this]() { do_connect(); });
}

void MqttClient::do_connect()
{
    if (m_stopped.load())
        return;

    BOOST_LOG_TRIVIAL(debug) << boost::format("MqttClient - connecting to %1%:%2% as %3%") % m_host % m_port % m_client_id;
    try {
        m_client->connect(m_conn_opts, nullptr, m_listener);
    } catch (const mqtt::exception& e) {
        fail(std::string("connect: ") + e.what());
    }
}

void MqttClient::onConnected(const std::string& cause)
{
    if (m_connected.exchange(true))
        return;

    BOOST_LOG_TRIVIAL(info) << boost::format("MqttClient - connected to %1%:%2% (%3%)") % m_host % m_port % cause;
    net::post(m_ioc, [this]() { m_backoff = MIN_RECONNECT_DELAY; });
    onConnectSignal();
}

void MqttClient::onConnectionLost(const std::string& cause)
{
    m_connected.store(false);
    if (m_stopped.load())
        return;

    const std::string message = "connection lost" + (cause.empty() ? std::string() : ": " + cause);
    BOOST_LOG_TRIVIAL(warning) << boost::format("MqttClient - %1%:%2% %3%, reconnecting") % m_host % m_port % message;
    onErrorSignal(message);
}

void MqttClient::fail(const std::string& message)
{
    m_connected.store(false);
    if (m_stopped.load())
        return;

    onErrorSignal(message);
    net::post(m_ioc, [this, message]() {
        BOOST_LOG_TRIVIAL(warning) << boost::format("MqttClient - %1%:%2% %3%, reconnecting in %4%s") % m_host % m_port % message %
                                          m_backoff.count();
        m_reconnect_timer.expires_after(m_backoff);
        m_reconnect_timer.async_wait([this](const boost::system::error_code& ec) {
            if (!ec)
                do_connect();
        });
        m_backoff = std::min(m_backoff * 2, MAX_RECONNECT_DELAY);
    });
}

void MqttClient::publish(const std::string& topic, const nlohmann::json& payload)
{
    if (m_stopped.load()) {
        BOOST_LOG_TRIVIAL(warning) << boost::format("MqttClient - %1% is shut down, dropping message to %2%") % m_host % topic;
        return;
    }

    const std::string data = payload.dump();
    BOOST_LOG_TRIVIAL(debug) << boost::format("MqttClient - publish to %1%: %2%") % topic % data;
    try {
        m_client->publish(topic, data.data(), data.size(), 0, false);
    } catch (const mqtt::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << boost::format("MqttClient - %1%: cannot publish to %2%: %3%") % m_host % topic % e.what();
        onErrorSignal(std::string("publish: ") + e.what());
    }
}

void MqttClient::shutdown()
{
    if (m_stopped.exchange(true))
        return;

    if (m_worker.joinable()) {
        net::post(m_ioc, [this]() {
            m_reconnect_timer.cancel();
            m_work.reset();
        });
        m_worker.join();
    }

    if (m_started.load() && m_client) {
        try {
            m_client->disconnect(DISCONNECT_GRACE)->wait();
        } catch (const mqtt::exception& e) {
            BOOST_LOG_TRIVIAL(debug) << boost::format("MqttClient - disconnect from %1%: %2%") % m_host % e.what();
        }
    }
    m_connected.store(false);
    BOOST_LOG_TRIVIAL(debug) << "MqttClient - stopped " << m_host;
}

} // namespace PandaPrint
