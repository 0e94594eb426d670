#ifndef pandaprint_Utils_hpp_
#define pandaprint_Utils_hpp_

#include <string>
#include <utility>
#include <vector>

#include <boost/log/trivial.hpp>
#include <boost/format.hpp>

namespace PandaPrint {

// Logging levels: 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
void         set_logging_level(unsigned int level);
unsigned int get_logging_level();
unsigned int level_string_to_boost(const std::string& level);
std::string  get_string_logging_level(unsigned int level);
// Adds a formatted console sink. Safe to call once per process.
void         init_console_log(unsigned int level);
// Adds a rotating file sink next to the console sink.
void         set_log_path_and_level(const std::string& file, unsigned int level);
void         flush_logs();

// "job.3mf" -> ("job", "3mf"), "a.b.gcode" -> ("a.b", "gcode"), "job" -> ("job", "").
std::pair<std::string, std::string> split_filename(const std::string& filename);

// Last path component of an uploaded filename, accepting both separators.
std::string sanitize_filename(const std::string& filename);

// Percent-decodes a URL path segment or query value. '+' is kept as is unless form_encoded.
std::string url_decode(const std::string& in, bool form_encoded = false);

} // namespace PandaPrint

#endif // pandaprint_Utils_hpp_
