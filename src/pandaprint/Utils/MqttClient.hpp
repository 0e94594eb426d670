#ifndef pandaprint_MqttClient_hpp_
#define pandaprint_MqttClient_hpp_

#include "CommandPublisher.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/signals2.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <mqtt/async_client.h>

namespace net = boost::asio;
namespace sig = boost::signals2;

namespace PandaPrint {

// MQTT over TLS client publishing with QoS 0 through the Paho asynchronous
// client. Messages published while disconnected are buffered by the client;
// lost connections are re-established by Paho, refused first connections are
// retried here with backoff.
class MqttClient : public CommandPublisher
{
public:
    MqttClient(const std::string& host, unsigned short port, const std::string& username, const std::string& password);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    // Starts the first connection attempt.
    void start();

    void publish(const std::string& topic, const nlohmann::json& payload) override;
    // Disconnects and stops reconnecting. Idempotent.
    void shutdown() override;

    bool is_connected() const { return m_connected.load(); }
    const std::string& client_id() const { return m_client_id; }

    static constexpr std::chrono::seconds MIN_RECONNECT_DELAY{1};
    static constexpr std::chrono::seconds MAX_RECONNECT_DELAY{120};
    static constexpr size_t               OUTBOX_LIMIT{100};

    // signals, emitted on the client's callback threads.
    typedef sig::signal<void ()> ConnectEvent;
    typedef sig::signal<void (std::string message)> ErrorEvent;

    typedef ConnectEvent::slot_type ConnectEventHandler;
    typedef ErrorEvent::slot_type ErrorEventHandler;

    sig::connection addConnectEventHandler(ConnectEventHandler handler) { return onConnectSignal.connect(handler); }
    sig::connection addErrorEventHandler(ErrorEventHandler handler) { return onErrorSignal.connect(handler); }

    ConnectEvent onConnectSignal;
    ErrorEvent onErrorSignal;

private:
    // Outcome of connect() calls; Paho reports success through the connected handler too.
    class ConnectListener : public virtual mqtt::iaction_listener
    {
    public:
        explicit ConnectListener(MqttClient& owner) : m_owner(owner) {}

    private:
        void on_failure(const mqtt::token& tok) override;
        void on_success(const mqtt::token& tok) override;

        MqttClient& m_owner;
    };

    void do_connect();
    void onConnected(const std::string& cause);
    void onConnectionLost(const std::string& cause);
    // Reports `message` and schedules the next connection attempt.
    void fail(const std::string& message);

    std::string           m_host;
    unsigned short        m_port;
    std::string           m_client_id;
    mqtt::connect_options m_conn_opts;
    // Declared before the client so it outlives the client's callbacks.
    ConnectListener                     m_listener;
    std::unique_ptr<mqtt::async_client> m_client;

    // Reconnect timer thread.
    net::io_context                                          m_ioc;
    net::executor_work_guard<net::io_context::executor_type> m_work;
    net::steady_timer                                        m_reconnect_timer;
    std::chrono::seconds                                     m_backoff{MIN_RECONNECT_DELAY};
    std::thread                                              m_worker;

    std::atomic<bool> m_started{false};
    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_connected{false};
};

} // namespace PandaPrint

#endif // pandaprint_MqttClient_hpp_
