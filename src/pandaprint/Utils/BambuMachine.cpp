#include "BambuMachine.hpp"
#include "MqttClient.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

namespace PandaPrint {

const char* const PRINTER_USERNAME = "bblp";

BambuMachine::BambuMachine(const PrinterConfig& config, CommandPublisherFactory publisher_factory)
    : m_config(config), m_publisher_factory(std::move(publisher_factory))
{}

BambuMachine::~BambuMachine()
{
    shutdown();
}

CommandPublisher& BambuMachine::mqtt()
{
    std::lock_guard<std::mutex> lock(m_mqtt_mutex);
    if (m_shut_down)
        throw RuntimeError("Printer " + m_config.name + " is shut down");

    if (!m_mqtt) {
        BOOST_LOG_TRIVIAL(info) << boost::format("BambuMachine - %1%: opening command channel to %2%:%3%") % m_config.name %
                                       m_config.host % m_config.mqtt_port;
        m_mqtt = m_publisher_factory(m_config);
        if (!m_mqtt)
            throw RuntimeError("No command channel for printer " + m_config.name);
    }
    return *m_mqtt;
}

bool BambuMachine::has_mqtt() const
{
    std::lock_guard<std::mutex> lock(m_mqtt_mutex);
    return m_mqtt != nullptr;
}

void BambuMachine::shutdown()
{
    std::lock_guard<std::mutex> lock(m_mqtt_mutex);
    if (m_shut_down)
        return;
    m_shut_down = true;
    if (m_mqtt)
        m_mqtt->shutdown();
}

CommandPublisherFactory BambuMachine::mqtt_publisher_factory()
{
    return [](const PrinterConfig& config) -> std::unique_ptr<CommandPublisher> {
        auto client = std::make_unique<MqttClient>(config.host, config.mqtt_port, PRINTER_USERNAME, config.key);
        client->start();
        return client;
    };
}

} // namespace PandaPrint
