#ifndef pandaprint_PrintAPI_hpp_
#define pandaprint_PrintAPI_hpp_

#include <map>
#include <string>

#include <boost/beast/http.hpp>

#include "nlohmann/json.hpp"

namespace beast = boost::beast;
namespace http  = beast::http;

namespace PandaPrint {

class BambuMachine;
class MachineRegistry;
class PrintUploader;

using HttpRequest  = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// The part of the OctoPrint REST API slicers use to send jobs, one API root per printer:
//   GET  /<printer>/api/version
//   POST /<printer>/api/files/<location>   multipart/form-data, fields "file" and "print"
class PrintAPI
{
public:
    PrintAPI(MachineRegistry& registry, PrintUploader& uploader);

    // Never throws; failures become JSON error responses.
    HttpResponse handle_request(const HttpRequest& req);

    static nlohmann::json version_info();

private:
    HttpResponse version(const HttpRequest& req, BambuMachine& machine);
    HttpResponse upload(const HttpRequest& req, BambuMachine& machine, const std::string& location,
                        const std::map<std::string, std::string>& query);

    MachineRegistry& m_registry;
    PrintUploader&   m_uploader;
};

// Path segments and query parameters of a request target, percent-decoded.
void split_target(const std::string& target, std::vector<std::string>& segments, std::map<std::string, std::string>& query);

HttpResponse make_json_response(const HttpRequest& req, http::status status, const nlohmann::json& body);
HttpResponse make_error_response(const HttpRequest& req, http::status status, const std::string& message);

} // namespace PandaPrint

#endif // pandaprint_PrintAPI_hpp_
