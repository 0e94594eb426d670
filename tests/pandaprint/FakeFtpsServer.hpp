#ifndef pandaprint_tests_FakeFtpsServer_hpp_
#define pandaprint_tests_FakeFtpsServer_hpp_

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

namespace PandaPrint { namespace test {

// Implicit TLS FTP server on 127.0.0.1 behaving like the printers: PASV
// advertises an unreachable host, data connections are TLS and record whether
// they resumed the control session. Serves one client at a time on a
// background thread.
class FakeFtpsServer
{
public:
    explicit FakeFtpsServer(const std::string& password = "5678");
    ~FakeFtpsServer();

    unsigned short port() const { return m_port; }

    void put_file(const std::string& path, const std::string& content);
    std::map<std::string, std::string> files() const;
    // Commands in arrival order, the password masked.
    std::vector<std::string> commands() const;
    // Reply sent to STOR instead of accepting the data, e.g. "550 Permission denied.".
    void fail_stores_with(const std::string& reply);

    int  data_connections() const;
    bool all_data_sessions_resumed() const;
    int  sessions() const;
    int  quits() const;

private:
    using ssl_stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

    void do_accept();
    void serve(boost::asio::ip::tcp::socket socket);
    std::string read_line(ssl_stream& stream, std::string& buffer);
    void reply(ssl_stream& stream, const std::string& text);
    std::unique_ptr<ssl_stream> accept_data(boost::asio::ip::tcp::acceptor& acceptor);

    boost::asio::io_context        m_ioc;
    boost::asio::ssl::context      m_ssl_ctx;
    boost::asio::ip::tcp::acceptor m_acceptor;
    unsigned short                 m_port{0};
    std::string                    m_password;
    std::thread                    m_thread;

    mutable std::mutex                 m_mutex;
    std::map<std::string, std::string> m_files;
    std::vector<std::string>           m_commands;
    std::vector<bool>                  m_data_resumed;
    std::string                        m_stor_reply;
    int                                m_sessions{0};
    int                                m_quits{0};
};

}} // namespace PandaPrint::test

#endif // pandaprint_tests_FakeFtpsServer_hpp_
