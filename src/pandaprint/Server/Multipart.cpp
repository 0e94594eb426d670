#include "Multipart.hpp"

#include "libpandaprint/Exception.hpp"

#include <boost/algorithm/string.hpp>

namespace PandaPrint {

namespace {

const std::string CRLF = "\r\n";

// Splits on ';' outside of double quotes.
std::vector<std::string> split_params(const std::string& value)
{
    std::vector<std::string> out(1);
    bool                     quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quoted && c == '\\' && i + 1 < value.size()) {
            out.back() += c;
            out.back() += value[++i];
        } else if (c == '"') {
            quoted = !quoted;
            out.back() += c;
        } else if (c == ';' && !quoted) {
            out.emplace_back();
        } else {
            out.back() += c;
        }
    }
    return out;
}

std::string unquote(const std::string& value)
{
    if (value.size() < 2 || value.front() != '"' || value.back() != '"')
        return value;
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        if (value[i] == '\\' && i + 2 < value.size())
            ++i;
        out += value[i];
    }
    return out;
}

void parse_part_headers(const std::string& block, FormPart& part)
{
    std::vector<std::string> lines;
    boost::split(lines, block, boost::is_any_of("\n"));
    for (auto line : lines) {
        boost::trim_right_if(line, boost::is_any_of("\r"));
        if (line.empty())
            continue;
        const size_t colon = line.find(':');
        if (colon == std::string::npos)
            throw InvalidArgument("Malformed multipart header: " + line);

        const std::string name  = boost::to_lower_copy(boost::trim_copy(line.substr(0, colon)));
        const std::string value = boost::trim_copy(line.substr(colon + 1));
        if (name == "content-disposition") {
            auto params = parse_header_params(value);
            if (boost::to_lower_copy(params[""]) != "form-data")
                throw InvalidArgument("Unexpected multipart disposition: " + value);
            part.name = params["name"];
            if (auto it = params.find("filename"); it != params.end())
                part.filename = it->second;
        } else if (name == "content-type") {
            part.content_type = value;
        }
    }
}

} // namespace

std::map<std::string, std::string> parse_header_params(const std::string& value)
{
    std::map<std::string, std::string> params;
    auto                               items = split_params(value);
    params[""]                               = boost::trim_copy(items.front());
    for (size_t i = 1; i < items.size(); ++i) {
        const std::string item = boost::trim_copy(items[i]);
        const size_t      eq   = item.find('=');
        if (eq == std::string::npos)
            continue;
        params[boost::to_lower_copy(boost::trim_copy(item.substr(0, eq)))] = unquote(boost::trim_copy(item.substr(eq + 1)));
    }
    return params;
}

MultipartForm MultipartForm::parse(const std::string& content_type, const std::string& body)
{
    auto params = parse_header_params(content_type);
    if (boost::to_lower_copy(params[""]) != "multipart/form-data")
        throw InvalidArgument("Expected multipart/form-data, got \"" + content_type + "\"");
    const std::string boundary = params["boundary"];
    if (boundary.empty())
        throw InvalidArgument("multipart/form-data without boundary");

    const std::string delimiter = "--" + boundary;
    size_t            pos       = body.find(delimiter);
    if (pos == std::string::npos)
        throw InvalidArgument("Multipart body does not contain its boundary");

    MultipartForm form;
    while (true) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0)
            return form;
        if (body.compare(pos, 2, CRLF) != 0)
            throw InvalidArgument("Malformed multipart boundary line");
        pos += 2;

        FormPart part;
        size_t   body_start;
        if (body.compare(pos, 2, CRLF) == 0) {
            body_start = pos + 2;
        } else {
            const size_t headers_end = body.find(CRLF + CRLF, pos);
            if (headers_end == std::string::npos)
                throw InvalidArgument("Unterminated multipart headers");
            parse_part_headers(body.substr(pos, headers_end - pos), part);
            body_start = headers_end + 4;
        }

        const size_t next = body.find(CRLF + delimiter, body_start);
        if (next == std::string::npos)
            throw InvalidArgument("Unterminated multipart part");
        part.body = body.substr(body_start, next - body_start);
        form.m_parts.push_back(std::move(part));
        pos = next + 2;
    }
}

const FormPart* MultipartForm::find(const std::string& name) const
{
    for (const auto& part : m_parts)
        if (part.name == name)
            return &part;
    return nullptr;
}

} // namespace PandaPrint
