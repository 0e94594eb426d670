#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PandaPrint {

struct FormPart
{
    std::string                name;
    std::optional<std::string> filename;
    std::string                content_type;
    std::string                body;
};

// Parameters of a header value such as `form-data; name="file"; filename="a;b.3mf"`.
// The leading value is stored under the empty key, parameter names are lower case.
std::map<std::string, std::string> parse_header_params(const std::string& value);

// multipart/form-data request body.
class MultipartForm
{
public:
    // Throws InvalidArgument when the content type has no boundary or the body is malformed.
    static MultipartForm parse(const std::string& content_type, const std::string& body);

    // First part with the given field name, nullptr if none.
    const FormPart*              find(const std::string& name) const;
    const std::vector<FormPart>& parts() const { return m_parts; }

private:
    std::vector<FormPart> m_parts;
};

} // namespace PandaPrint
