#ifndef pandaprint_PandaConfig_hpp_
#define pandaprint_PandaConfig_hpp_

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/node/node.h>

namespace PandaPrint {

// Per printer overrides merged into every print command sent to it.
struct PrintOptions
{
    std::optional<bool> timelapse;
    std::optional<bool> bed_levelling;
    std::optional<bool> flow_cali;
    std::optional<bool> vibration_cali;
    std::optional<bool> layer_inspect;
    std::optional<bool> use_ams;

    // Option names as they appear in the configuration and in the print command.
    static const std::vector<std::string>& names();

    // Pointer to the member named `name`, nullptr when unknown.
    std::optional<bool>*       find(const std::string& name);
    const std::optional<bool>* find(const std::string& name) const;

    bool empty() const;
};

struct PrinterConfig
{
    std::string    name;
    std::string    host;
    std::string    serial;
    std::string    key;
    unsigned short ftp_port{990};
    unsigned short mqtt_port{8883};
    PrintOptions   print_options;
};

class PandaConfig
{
public:
    PandaConfig() = default;

    // Throws ConfigError on unknown keys, missing fields, bad values and duplicate printer names.
    void load(const YAML::Node& data);
    void load_from_file(const std::string& path);

    std::string                listen_address{"::"};
    unsigned short             listen_port{8080};
    unsigned int               threads{10};
    std::vector<PrinterConfig> printers;
};

} // namespace PandaPrint

#endif // pandaprint_PandaConfig_hpp_
