#ifndef pandaprint_MachineRegistry_hpp_
#define pandaprint_MachineRegistry_hpp_

#include "pandaprint/Utils/BambuMachine.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace PandaPrint {

// Printers by name. Built once from the configuration, read concurrently afterwards.
class MachineRegistry
{
public:
    MachineRegistry(const std::vector<PrinterConfig>& printers,
                    CommandPublisherFactory           publisher_factory = BambuMachine::mqtt_publisher_factory());
    ~MachineRegistry();

    // Throws UnknownDeviceError.
    BambuMachine& find(const std::string& name) const;
    bool          contains(const std::string& name) const { return m_machines.count(name) != 0; }
    size_t        size() const { return m_machines.size(); }

    // Shuts down every open command channel.
    void shutdown_all();

private:
    std::map<std::string, std::unique_ptr<BambuMachine>> m_machines;
};

} // namespace PandaPrint

#endif // pandaprint_MachineRegistry_hpp_
