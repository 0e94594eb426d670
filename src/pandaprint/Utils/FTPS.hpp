#ifndef pandaprint_FTPS_hpp_
#define pandaprint_FTPS_hpp_

#include "TransferSession.hpp"

#include <string>

#include <curl/curl.h>

namespace PandaPrint {

// FTP client for implicit TLS servers on top of one libcurl easy handle.
// The control connection and every data connection are TLS from their first
// byte, data connections resume the control connection's TLS session and are
// dialled on the control host whatever PASV says.
//
// libcurl runs the whole handshake (login, PBSZ, PROT) on the first request,
// so the session is opened by enable_private_data_protection(), the last
// setup step, and kept open by the handle for the following transfers.
class FTPS : public TransferSession
{
public:
    FTPS();
    ~FTPS() override;

    FTPS(const FTPS&) = delete;
    FTPS& operator=(const FTPS&) = delete;

    void connect(const std::string& host, unsigned short port, std::chrono::seconds timeout) override;
    void login(const std::string& user, const std::string& password) override;
    void enable_private_data_protection() override;
    void store_binary(const std::string& remote_path, std::istream& content) override;
    void retrieve_binary(const std::string& remote_path, std::ostream& out) override;
    void quit() override;

    bool is_open() const { return m_open; }
    // Last reply line received from the server.
    const std::string& last_reply() const { return m_last_reply; }

private:
    static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata);

    CURL* handle(const std::string& what) const;
    // ftps://host:port/ followed by the escaped absolute path.
    std::string url_for(const std::string& remote_path) const;
    void        set_common_options();
    // Runs the configured request, throws FtpReplyError or TransferError on failure.
    void perform(const std::string& what);
    void open_session();

    CURL*                m_curl{nullptr};
    std::string          m_host;
    unsigned short       m_port{990};
    std::chrono::seconds m_timeout{30};
    std::string          m_user;
    std::string          m_password;
    bool                 m_protect_data{false};
    bool                 m_open{false};
    std::string          m_last_reply;
    char                 m_error[CURL_ERROR_SIZE]{};
};

} // namespace PandaPrint

#endif // pandaprint_FTPS_hpp_
