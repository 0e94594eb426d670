#include "MachineRegistry.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

namespace PandaPrint {

MachineRegistry::MachineRegistry(const std::vector<PrinterConfig>& printers, CommandPublisherFactory publisher_factory)
{
    for (const auto& printer : printers) {
        auto machine = std::make_unique<BambuMachine>(printer, publisher_factory);
        if (!m_machines.emplace(printer.name, std::move(machine)).second)
            throw ConfigError("Duplicate printer name \"" + printer.name + "\"");
        BOOST_LOG_TRIVIAL(debug) << boost::format("MachineRegistry - added %1% (%2%, serial %3%)") % printer.name % printer.host %
                                        printer.serial;
    }
}

MachineRegistry::~MachineRegistry()
{
    shutdown_all();
}

BambuMachine& MachineRegistry::find(const std::string& name) const
{
    auto it = m_machines.find(name);
    if (it == m_machines.end())
        throw UnknownDeviceError("Unknown printer \"" + name + "\"");
    return *it->second;
}

void MachineRegistry::shutdown_all()
{
    for (auto& [name, machine] : m_machines) {
        if (machine->has_mqtt())
            BOOST_LOG_TRIVIAL(info) << "MachineRegistry - closing command channel of " << name;
        machine->shutdown();
    }
}

} // namespace PandaPrint
