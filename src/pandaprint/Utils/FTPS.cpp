#include "FTPS.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

#include <cctype>
#include <istream>
#include <mutex>
#include <ostream>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace PandaPrint {

namespace {

std::once_flag curl_init_flag;

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata)
{
    auto* in = static_cast<std::istream*>(userdata);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (in->bad())
        return CURL_READFUNC_ABORT;
    return static_cast<size_t>(in->gcount());
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* out = static_cast<std::ostream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    // A short count makes libcurl abort the transfer.
    return *out ? size * nmemb : 0;
}

// Bytes left in a seekable stream, -1 when unknown.
curl_off_t remaining_size(std::istream& in)
{
    const auto start = in.tellg();
    if (start < 0)
        return -1;
    in.seekg(0, std::ios::end);
    const auto end = in.tellg();
    in.clear();
    in.seekg(start);
    return end < 0 ? -1 : static_cast<curl_off_t>(end - start);
}

bool has_reply_code(const std::string& line)
{
    return line.size() >= 3 && std::isdigit((unsigned char) line[0]) && std::isdigit((unsigned char) line[1]) &&
           std::isdigit((unsigned char) line[2]);
}

} // namespace

FTPS::FTPS()
{
    std::call_once(curl_init_flag, []() {
        const CURLcode res = ::curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK)
            BOOST_LOG_TRIVIAL(error) << "FTPS - failed to initialize libcurl: " << ::curl_easy_strerror(res);
    });
}

FTPS::~FTPS() { quit(); }

size_t FTPS::header_cb(char* buffer, size_t size, size_t nitems, void* userdata)
{
    auto*       self = static_cast<FTPS*>(userdata);
    std::string line(buffer, size * nitems);
    boost::trim_right(line);
    if (has_reply_code(line)) {
        BOOST_LOG_TRIVIAL(trace) << "FTPS - < " << line;
        self->m_last_reply = line;
    }
    return size * nitems;
}

CURL* FTPS::handle(const std::string& what) const
{
    if (m_curl == nullptr)
        throw TransferError(what + ": FTP session is not connected");
    return m_curl;
}

std::string FTPS::url_for(const std::string& remote_path) const
{
    const std::string host = m_host.find(':') != std::string::npos ? "[" + m_host + "]" : m_host;
    std::string       url  = "ftps://" + host + ":" + std::to_string(m_port) + "/";

    std::vector<std::string> segments;
    boost::split(segments, remote_path, boost::is_any_of("/"));
    bool first = true;
    for (const auto& segment : segments) {
        if (segment.empty())
            continue;
        char* escaped = ::curl_easy_escape(m_curl, segment.c_str(), static_cast<int>(segment.size()));
        if (escaped == nullptr)
            throw TransferError("Cannot escape remote path " + remote_path);
        // %2F keeps the path absolute instead of relative to the login directory.
        url += (first ? "%2F" : "/") + std::string(escaped);
        ::curl_free(escaped);
        first = false;
    }
    return url;
}

void FTPS::set_common_options()
{
    ::curl_easy_setopt(m_curl, CURLOPT_USE_SSL, (long) CURLUSESSL_CONTROL);
    // Printers present self signed certificates.
    ::curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYPEER, 0L);
    ::curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYHOST, 0L);
    ::curl_easy_setopt(m_curl, CURLOPT_SSL_SESSIONID_CACHE, 1L);
    ::curl_easy_setopt(m_curl, CURLOPT_FTP_USE_EPSV, 0L);
    // The PASV host is often an unreachable internal address; only the port counts.
    ::curl_easy_setopt(m_curl, CURLOPT_FTP_SKIP_PASV_IP, 1L);
    ::curl_easy_setopt(m_curl, CURLOPT_FTP_FILEMETHOD, (long) CURLFTPMETHOD_NOCWD);
    ::curl_easy_setopt(m_curl, CURLOPT_CONNECTTIMEOUT, (long) m_timeout.count());
    ::curl_easy_setopt(m_curl, CURLOPT_FTP_RESPONSE_TIMEOUT, (long) m_timeout.count());
    ::curl_easy_setopt(m_curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    ::curl_easy_setopt(m_curl, CURLOPT_LOW_SPEED_TIME, (long) m_timeout.count());
    ::curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);
    ::curl_easy_setopt(m_curl, CURLOPT_VERBOSE, get_logging_level() >= 5 ? 1L : 0L);
    ::curl_easy_setopt(m_curl, CURLOPT_HEADERFUNCTION, header_cb);
    ::curl_easy_setopt(m_curl, CURLOPT_HEADERDATA, static_cast<void*>(this));
    ::curl_easy_setopt(m_curl, CURLOPT_ERRORBUFFER, m_error);
}

void FTPS::connect(const std::string& host, unsigned short port, std::chrono::seconds timeout)
{
    quit();
    m_host    = host;
    m_port    = port;
    m_timeout = timeout;

    m_curl = ::curl_easy_init();
    if (m_curl == nullptr)
        throw TransferError("Failed to initialize libcurl");
    set_common_options();
    BOOST_LOG_TRIVIAL(debug) << boost::format("FTPS - session to %1%:%2%") % host % port;
}

void FTPS::login(const std::string& user, const std::string& password)
{
    CURL* curl = handle("Log in");
    m_user     = user;
    m_password = password;
    ::curl_easy_setopt(curl, CURLOPT_USERNAME, m_user.c_str());
    ::curl_easy_setopt(curl, CURLOPT_PASSWORD, m_password.c_str());
    m_open = false;
}

void FTPS::enable_private_data_protection()
{
    CURL* curl = handle("Enable data protection");
    ::curl_easy_setopt(curl, CURLOPT_USE_SSL, (long) CURLUSESSL_ALL);
    m_protect_data = true;
    open_session();
}

void FTPS::open_session()
{
    CURL* curl = handle("Open session");
    ::curl_easy_setopt(curl, CURLOPT_URL, url_for("").c_str());
    ::curl_easy_setopt(curl, CURLOPT_UPLOAD, 0L);
    ::curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    perform((boost::format("Log in to %1%:%2%") % m_host % m_port).str());
    BOOST_LOG_TRIVIAL(debug) << boost::format("FTPS - logged in to %1% as %2%, data protection: %3%") % m_host % m_user %
                                    m_protect_data;
}

void FTPS::perform(const std::string& what)
{
    m_error[0] = '\0';
    m_last_reply.clear();

    const CURLcode res = ::curl_easy_perform(m_curl);
    if (res == CURLE_OK) {
        m_open = true;
        return;
    }

    long code = 0;
    ::curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &code);
    const std::string detail = m_error[0] != '\0' ? std::string(m_error) : std::string(::curl_easy_strerror(res));
    BOOST_LOG_TRIVIAL(error) << boost::format("FTPS - %1% failed with error [%2%]: %3%") % what % res % detail;

    if (code >= 400) {
        if (boost::starts_with(m_last_reply, std::to_string(code)))
            throw FtpReplyError(static_cast<int>(code), m_last_reply);
        throw FtpReplyError(static_cast<int>(code), std::to_string(code) + " " + detail);
    }
    throw TransferError(what + ": " + detail);
}

void FTPS::store_binary(const std::string& remote_path, std::istream& content)
{
    CURL* curl = handle("Store " + remote_path);
    ::curl_easy_setopt(curl, CURLOPT_URL, url_for(remote_path).c_str());
    ::curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
    ::curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    ::curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_cb);
    ::curl_easy_setopt(curl, CURLOPT_READDATA, static_cast<void*>(&content));
    ::curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, remaining_size(content));
    perform("Store " + remote_path);

    curl_off_t sent = 0;
    ::curl_easy_getinfo(curl, CURLINFO_SIZE_UPLOAD_T, &sent);
    BOOST_LOG_TRIVIAL(info) << boost::format("FTPS - stored %1% (%2% bytes) on %3%") % remote_path % sent % m_host;
}

void FTPS::retrieve_binary(const std::string& remote_path, std::ostream& out)
{
    CURL* curl = handle("Retrieve " + remote_path);
    ::curl_easy_setopt(curl, CURLOPT_URL, url_for(remote_path).c_str());
    ::curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
    ::curl_easy_setopt(curl, CURLOPT_UPLOAD, 0L);
    ::curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    ::curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&out));
    perform("Retrieve " + remote_path);
}

void FTPS::quit()
{
    if (m_curl == nullptr)
        return;

    // Closing the handle sends QUIT on the control connection it keeps open.
    ::curl_easy_cleanup(m_curl);
    m_curl = nullptr;
    m_open = false;
}

} // namespace PandaPrint
