#include "PandaConfig.hpp"

#include "Exception.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <set>

#include <yaml-cpp/yaml.h>

namespace PandaPrint {

const std::vector<std::string>& PrintOptions::names()
{
    static const std::vector<std::string> option_names = {
        "timelapse", "bed_levelling", "flow_cali", "vibration_cali", "layer_inspect", "use_ams"};
    return option_names;
}

std::optional<bool>* PrintOptions::find(const std::string& name)
{
    return const_cast<std::optional<bool>*>(static_cast<const PrintOptions*>(this)->find(name));
}

const std::optional<bool>* PrintOptions::find(const std::string& name) const
{
    if (name == "timelapse")      return &timelapse;
    if (name == "bed_levelling")  return &bed_levelling;
    if (name == "flow_cali")      return &flow_cali;
    if (name == "vibration_cali") return &vibration_cali;
    if (name == "layer_inspect")  return &layer_inspect;
    if (name == "use_ams")        return &use_ams;
    return nullptr;
}

bool PrintOptions::empty() const
{
    for (const auto& name : names())
        if (find(name)->has_value())
            return false;
    return true;
}

namespace {

// A key that is absent or written without a value.
bool is_unset(const YAML::Node& value) { return !value || value.IsNull(); }

template<typename T>
T scalar_as(const YAML::Node& value, const std::string& key, const char* expected, const std::string& where)
{
    if (!value.IsScalar())
        throw ConfigError((boost::format("%1%: \"%2%\" must be %3%") % where % key % expected).str());
    try {
        return value.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError((boost::format("%1%: \"%2%\" must be %3%, got \"%4%\"") % where % key % expected % value.Scalar()).str());
    }
}

unsigned short get_port(const YAML::Node& node, const std::string& key, unsigned short default_port, const std::string& where)
{
    const YAML::Node value = node[key];
    if (is_unset(value))
        return default_port;

    const int port = scalar_as<int>(value, key, "a valid port", where);
    if (port < 0 || port > 65535)
        throw ConfigError((boost::format("%1%: \"%2%\" is not a valid port: %3%") % where % key % port).str());
    return static_cast<unsigned short>(port);
}

std::string get_required(const YAML::Node& node, const std::string& key, const std::string& where)
{
    const YAML::Node value = node[key];
    if (is_unset(value))
        throw ConfigError((boost::format("%1%: missing required key \"%2%\"") % where % key).str());
    std::string text = scalar_as<std::string>(value, key, "a string", where);
    if (text.empty())
        throw ConfigError((boost::format("%1%: missing required key \"%2%\"") % where % key).str());
    return text;
}

PrinterConfig load_printer(const YAML::Node& node, size_t idx)
{
    const std::string where = "printers[" + std::to_string(idx) + "]";
    if (!node.IsMap())
        throw ConfigError(where + ": must be a mapping");

    static const std::set<std::string> connection_keys = {"name", "host", "serial", "key", "ftp-port", "mqtt-port"};
    for (const auto& kv : node) {
        const std::string key = kv.first.Scalar();
        if (connection_keys.count(key) == 0 &&
            std::find(PrintOptions::names().begin(), PrintOptions::names().end(), key) == PrintOptions::names().end())
            throw ConfigError((boost::format("%1%: unknown key \"%2%\"") % where % key).str());
    }

    PrinterConfig printer;
    printer.name      = get_required(node, "name", where);
    printer.host      = get_required(node, "host", where);
    printer.serial    = get_required(node, "serial", where);
    printer.key       = get_required(node, "key", where);
    printer.ftp_port  = get_port(node, "ftp-port", printer.ftp_port, where);
    printer.mqtt_port = get_port(node, "mqtt-port", printer.mqtt_port, where);

    for (const auto& name : PrintOptions::names()) {
        const YAML::Node value = node[name];
        if (is_unset(value))
            continue;
        *printer.print_options.find(name) = scalar_as<bool>(value, name, "a boolean", where);
    }
    return printer;
}

} // namespace

void PandaConfig::load(const YAML::Node& data)
{
    // An empty document keeps the defaults.
    if (is_unset(data))
        return;
    if (!data.IsMap())
        throw ConfigError("config: the document must be a mapping");

    static const std::set<std::string> known_keys = {"listen-address", "listen-port", "threads", "printers"};
    for (const auto& kv : data)
        if (known_keys.count(kv.first.Scalar()) == 0)
            BOOST_LOG_TRIVIAL(warning) << boost::format("PandaConfig - ignoring unknown key \"%1%\"") % kv.first.Scalar();

    std::string    address = listen_address;
    unsigned short port    = get_port(data, "listen-port", listen_port, "config");
    unsigned int   count   = threads;
    if (!is_unset(data["listen-address"]))
        address = scalar_as<std::string>(data["listen-address"], "listen-address", "a string", "config");
    if (!is_unset(data["threads"])) {
        const int value = scalar_as<int>(data["threads"], "threads", "a positive integer", "config");
        if (value < 1)
            throw ConfigError("config: \"threads\" must be a positive integer");
        count = static_cast<unsigned int>(value);
    }

    std::vector<PrinterConfig> loaded;
    std::set<std::string>      seen;
    const YAML::Node           list = data["printers"];
    if (!is_unset(list)) {
        if (!list.IsSequence())
            throw ConfigError("config: \"printers\" must be a list");
        for (size_t idx = 0; idx < list.size(); ++idx) {
            PrinterConfig printer = load_printer(list[idx], idx);
            if (!seen.insert(printer.name).second)
                throw ConfigError("config: duplicate printer name \"" + printer.name + "\"");
            loaded.push_back(std::move(printer));
        }
    }

    listen_address = std::move(address);
    listen_port    = port;
    threads        = count;
    printers       = std::move(loaded);
}

void PandaConfig::load_from_file(const std::string& path)
{
    YAML::Node data;
    try {
        data = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot read configuration " + path + ": " + e.what());
    }
    load(data);
    BOOST_LOG_TRIVIAL(info) << boost::format("PandaConfig - loaded %1% printer(s) from %2%") % printers.size() % path;
}

} // namespace PandaPrint
