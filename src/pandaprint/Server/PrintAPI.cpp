#include "PrintAPI.hpp"
#include "MachineRegistry.hpp"
#include "Multipart.hpp"

#include "pandaprint/Utils/PrintUploader.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

#include <boost/algorithm/string.hpp>

namespace PandaPrint {

namespace {

const char* const SERVER_NAME = "PandaPrint";

bool is_true(const std::string& value) { return boost::iequals(boost::trim_copy(value), "true"); }

std::string to_string(beast::string_view sv) { return std::string(sv.data(), sv.size()); }

} // namespace

void split_target(const std::string& target, std::vector<std::string>& segments, std::map<std::string, std::string>& query)
{
    const size_t      qmark = target.find('?');
    const std::string path  = target.substr(0, qmark);

    std::vector<std::string> parts;
    boost::split(parts, path, boost::is_any_of("/"));
    for (const auto& part : parts)
        if (!part.empty())
            segments.push_back(url_decode(part));

    if (qmark == std::string::npos)
        return;

    const std::string        query_string = target.substr(qmark + 1);
    std::vector<std::string> pairs;
    boost::split(pairs, query_string, boost::is_any_of("&"));
    for (const auto& pair : pairs) {
        if (pair.empty())
            continue;
        const size_t eq = pair.find('=');
        if (eq == std::string::npos)
            query[url_decode(pair, true)] = "";
        else
            query[url_decode(pair.substr(0, eq), true)] = url_decode(pair.substr(eq + 1), true);
    }
}

HttpResponse make_json_response(const HttpRequest& req, http::status status, const nlohmann::json& body)
{
    HttpResponse res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse make_error_response(const HttpRequest& req, http::status status, const std::string& message)
{
    return make_json_response(req, status, {{"error", message}});
}

PrintAPI::PrintAPI(MachineRegistry& registry, PrintUploader& uploader) : m_registry(registry), m_uploader(uploader) {}

nlohmann::json PrintAPI::version_info()
{
    return {{"api", "1.1.0"}, {"server", "1.1.0"}, {"text", "OctoPrint 1.1.0 (PandaPrint 1.0)"}};
}

HttpResponse PrintAPI::handle_request(const HttpRequest& req)
{
    const std::string target = to_string(req.target());
    try {
        std::vector<std::string>           segments;
        std::map<std::string, std::string> query;
        split_target(target, segments, query);

        if (segments.size() == 3 && segments[1] == "api" && segments[2] == "version") {
            if (req.method() != http::verb::get)
                return make_error_response(req, http::status::method_not_allowed, "Method not allowed");
            return version(req, m_registry.find(segments[0]));
        }
        if (segments.size() == 4 && segments[1] == "api" && segments[2] == "files") {
            if (req.method() != http::verb::post)
                return make_error_response(req, http::status::method_not_allowed, "Method not allowed");
            return upload(req, m_registry.find(segments[0]), segments[3], query);
        }
        return make_error_response(req, http::status::not_found, "Not found");
    } catch (const UnknownDeviceError& e) {
        BOOST_LOG_TRIVIAL(warning) << boost::format("PrintAPI - %1% %2%: %3%") % req.method_string() % target % e.what();
        return make_error_response(req, http::status::not_found, e.what());
    } catch (const InvalidArgument& e) {
        BOOST_LOG_TRIVIAL(warning) << boost::format("PrintAPI - %1% %2%: %3%") % req.method_string() % target % e.what();
        return make_error_response(req, http::status::bad_request, e.what());
    } catch (const TransferError& e) {
        BOOST_LOG_TRIVIAL(error) << boost::format("PrintAPI - %1% %2%: transfer failed: %3%") % req.method_string() % target % e.what();
        return make_error_response(req, http::status::internal_server_error, e.what());
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << boost::format("PrintAPI - %1% %2%: %3%") % req.method_string() % target % e.what();
        return make_error_response(req, http::status::internal_server_error, e.what());
    }
}

HttpResponse PrintAPI::version(const HttpRequest& req, BambuMachine& machine)
{
    // Clients call this first, open the command channel now.
    machine.mqtt();
    return make_json_response(req, http::status::ok, version_info());
}

HttpResponse PrintAPI::upload(const HttpRequest& req, BambuMachine& machine, const std::string& location,
                              const std::map<std::string, std::string>& query)
{
    const auto form = MultipartForm::parse(to_string(req[http::field::content_type]), req.body());

    const FormPart* file = form.find("file");
    if (file == nullptr || !file->filename)
        throw InvalidArgument("Missing \"file\" field");
    const std::string filename = sanitize_filename(*file->filename);
    if (filename.empty())
        throw InvalidArgument("Invalid filename \"" + *file->filename + "\"");

    bool do_print = false;
    if (const FormPart* print = form.find("print"))
        do_print = is_true(print->body);
    else if (auto it = query.find("print"); it != query.end())
        do_print = is_true(it->second);

    const std::string stored = m_uploader.upload(machine, filename, file->body, do_print);

    const std::string resource = "/" + machine.name() + "/api/files/" + location + "/" + stored;

    nlohmann::json file_info;
    file_info["name"]             = stored;
    file_info["origin"]           = location;
    file_info["refs"]["resource"] = resource;
    nlohmann::json body;
    body["done"]            = true;
    body["files"][location] = file_info;

    HttpResponse res = make_json_response(req, http::status::created, body);
    res.set(http::field::location, resource);
    return res;
}

} // namespace PandaPrint
