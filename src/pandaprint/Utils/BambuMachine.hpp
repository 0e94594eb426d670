#ifndef pandaprint_BambuMachine_hpp_
#define pandaprint_BambuMachine_hpp_

#include "CommandPublisher.hpp"
#include "libpandaprint/PandaConfig.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace PandaPrint {

// User name of both the FTP and the MQTT service of the printers; the password is the access code.
extern const char* const PRINTER_USERNAME; // "bblp"

using CommandPublisherFactory = std::function<std::unique_ptr<CommandPublisher>(const PrinterConfig&)>;

// A configured printer. Owns its command channel, created on first use and
// kept until shutdown.
class BambuMachine
{
public:
    BambuMachine(const PrinterConfig& config, CommandPublisherFactory publisher_factory);
    ~BambuMachine();

    BambuMachine(const BambuMachine&) = delete;
    BambuMachine& operator=(const BambuMachine&) = delete;

    const PrinterConfig& config() const { return m_config; }
    const std::string&   name() const { return m_config.name; }

    // Creates the command channel when it does not exist yet. Concurrent first calls
    // create exactly one. Throws RuntimeError after shutdown().
    CommandPublisher& mqtt();
    bool              has_mqtt() const;

    void shutdown();

    // MQTT over TLS to host:mqtt-port, logged in as PRINTER_USERNAME with the access code.
    static CommandPublisherFactory mqtt_publisher_factory();

private:
    PrinterConfig                     m_config;
    CommandPublisherFactory           m_publisher_factory;
    mutable std::mutex                m_mqtt_mutex;
    std::unique_ptr<CommandPublisher> m_mqtt;
    bool                              m_shut_down{false};
};

} // namespace PandaPrint

#endif // pandaprint_BambuMachine_hpp_
