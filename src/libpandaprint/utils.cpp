#include "Utils.hpp"

#include <cctype>
#include <map>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace PandaPrint {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::error;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned int level_string_to_boost(const std::string& level)
{
    static const std::map<std::string, unsigned int> levels = {
        {"fatal", 0}, {"error", 1}, {"warning", 2}, {"info", 3}, {"debug", 4}, {"trace", 5}};

    auto it = levels.find(boost::to_lower_copy(level));
    return it == levels.end() ? 1 : it->second;
}

std::string get_string_logging_level(unsigned level)
{
    switch (level) {
    case 0: return "fatal";
    case 1: return "error";
    case 2: return "warning";
    case 3: return "info";
    case 4: return "debug";
    case 5: return "trace";
    default: return "error";
    }
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace attrs = boost::log::attributes;

static auto log_format()
{
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << expr::attr<logging::trivial::severity_level>("Severity") << "]"
        << "[Thread " << expr::attr<attrs::current_thread_id::value_type>("ThreadID") << "]"
        << ": " << expr::smessage;
}

boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> g_log_sink;

void init_console_log(unsigned int level)
{
    logging::add_console_log(std::clog, keywords::format = log_format(), keywords::auto_flush = true);
    logging::add_common_attributes();
    set_logging_level(level);
}

void set_log_path_and_level(const std::string& file, unsigned int level)
{
    g_log_sink = logging::add_file_log(
        keywords::file_name = file + ".%N",
        keywords::rotation_size = 100 * 1024 * 1024,
        keywords::open_mode = std::ios_base::app,
        keywords::format = log_format()
    );

    logging::add_common_attributes();

    set_logging_level(level);
}

void flush_logs()
{
    if (g_log_sink)
        g_log_sink->flush();
}

std::pair<std::string, std::string> split_filename(const std::string& filename)
{
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos)
        return {filename, ""};
    return {filename.substr(0, dot), filename.substr(dot + 1)};
}

std::string sanitize_filename(const std::string& filename)
{
    const auto sep = filename.find_last_of("/\\");
    std::string name = sep == std::string::npos ? filename : filename.substr(sep + 1);
    boost::trim(name);
    if (name == "." || name == "..")
        name.clear();
    return name;
}

std::string url_decode(const std::string& in, bool form_encoded)
{
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            int hi = hex(in[i + 1]);
            int lo = hex(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        } else if (c == '+' && form_encoded) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace PandaPrint
