#include "PrintCommand.hpp"

#include "libpandaprint/PandaConfig.hpp"
#include "libpandaprint/Format/PlateArchive.hpp"

namespace PandaPrint {

std::string printer_request_topic(const std::string& serial) { return "device/" + serial + "/request"; }

nlohmann::json make_print_command(const std::string& filename, const PrintOptions& options)
{
    nlohmann::json print = {
        {"sequence_id", "0"},
        {"command", "project_file"},
        {"param", CANONICAL_PLATE_GCODE},
        {"project_id", "0"},
        {"profile_id", "0"},
        {"task_id", "0"},
        {"subtask_id", "0"},
        {"subtask_name", ""},
        {"url", "file:///sdcard/model/" + filename},
        {"bed_type", "auto"},
    };

    for (const auto& name : PrintOptions::names()) {
        const auto* value = options.find(name);
        if (value->has_value())
            print[name] = **value;
    }
    return {{"print", print}};
}

} // namespace PandaPrint
