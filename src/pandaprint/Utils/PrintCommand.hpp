#ifndef pandaprint_PrintCommand_hpp_
#define pandaprint_PrintCommand_hpp_

#include <string>

#include "nlohmann/json.hpp"

namespace PandaPrint {

struct PrintOptions;

// Topic the printer listens on for commands.
std::string printer_request_topic(const std::string& serial);

// "project_file" command starting plate 1 of /sdcard/model/<filename>, with every
// option set in `options` merged into the command.
nlohmann::json make_print_command(const std::string& filename, const PrintOptions& options);

} // namespace PandaPrint

#endif // pandaprint_PrintCommand_hpp_
