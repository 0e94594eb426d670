#include "FakeFtpsServer.hpp"
#include "test_utils.hpp"

#include <array>
#include <memory>

#include <boost/algorithm/string.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/format.hpp>

#include <openssl/ssl.h>

namespace net = boost::asio;
using tcp     = boost::asio::ip::tcp;

namespace PandaPrint { namespace test {

namespace {

const char SESSION_ID_CONTEXT[] = "pandaprint-ftps-test";

} // namespace

FakeFtpsServer::FakeFtpsServer(const std::string& password)
    : m_ssl_ctx(net::ssl::context::tls_server), m_acceptor(m_ioc), m_password(password)
{
    use_self_signed_certificate(m_ssl_ctx);
    // Session ids make resumption observable on the data connections.
    SSL_CTX_set_max_proto_version(m_ssl_ctx.native_handle(), TLS1_2_VERSION);
    SSL_CTX_set_session_cache_mode(m_ssl_ctx.native_handle(), SSL_SESS_CACHE_SERVER);
    SSL_CTX_set_session_id_context(m_ssl_ctx.native_handle(), reinterpret_cast<const unsigned char*>(SESSION_ID_CONTEXT),
                                   sizeof(SESSION_ID_CONTEXT) - 1);

    const tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), 0);
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(net::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen();
    m_port = m_acceptor.local_endpoint().port();

    do_accept();
    m_thread = std::thread([this]() { m_ioc.run(); });
}

FakeFtpsServer::~FakeFtpsServer()
{
    net::post(m_ioc, [this]() {
        boost::system::error_code ignored;
        m_acceptor.close(ignored);
    });
    m_thread.join();
}

void FakeFtpsServer::do_accept()
{
    m_acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec)
            return;
        serve(std::move(socket));
        do_accept();
    });
}

void FakeFtpsServer::put_file(const std::string& path, const std::string& content)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files[path] = content;
}

std::map<std::string, std::string> FakeFtpsServer::files() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files;
}

std::vector<std::string> FakeFtpsServer::commands() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commands;
}

void FakeFtpsServer::fail_stores_with(const std::string& reply)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stor_reply = reply;
}

int FakeFtpsServer::data_connections() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return int(m_data_resumed.size());
}

bool FakeFtpsServer::all_data_sessions_resumed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (bool resumed : m_data_resumed)
        if (!resumed)
            return false;
    return !m_data_resumed.empty();
}

int FakeFtpsServer::sessions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions;
}

int FakeFtpsServer::quits() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_quits;
}

std::string FakeFtpsServer::read_line(ssl_stream& stream, std::string& buffer)
{
    const size_t n    = net::read_until(stream, net::dynamic_buffer(buffer), "\r\n");
    std::string  line = buffer.substr(0, n - 2);
    buffer.erase(0, n);
    return line;
}

void FakeFtpsServer::reply(ssl_stream& stream, const std::string& text)
{
    net::write(stream, net::buffer(text + "\r\n"));
}

std::unique_ptr<FakeFtpsServer::ssl_stream> FakeFtpsServer::accept_data(tcp::acceptor& acceptor)
{
    // Clients dialling the advertised host never arrive, give up after a while.
    acceptor.non_blocking(true);
    tcp::socket               socket(m_ioc);
    boost::system::error_code ec;
    for (int i = 0; i < 1000; ++i) {
        acceptor.accept(socket, ec);
        if (ec != net::error::would_block && ec != net::error::try_again)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (ec)
        return nullptr;

    socket.non_blocking(false);
    auto data = std::make_unique<ssl_stream>(std::move(socket), m_ssl_ctx);
    data->handshake(net::ssl::stream_base::server, ec);
    if (ec)
        return nullptr;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_data_resumed.push_back(SSL_session_reused(data->native_handle()) == 1);
    return data;
}

void FakeFtpsServer::serve(tcp::socket socket)
{
    ssl_stream                stream(std::move(socket), m_ssl_ctx);
    boost::system::error_code ec;
    stream.handshake(net::ssl::stream_base::server, ec);
    if (ec)
        return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_sessions;
    }

    std::string                    buffer;
    std::string                    user;
    bool                           logged_in = false;
    std::unique_ptr<tcp::acceptor> passive;

    try {
        reply(stream, "220-PandaPrint test server\r\n220 Ready");
        while (true) {
            const std::string line = read_line(stream, buffer);
            const size_t      sp   = line.find(' ');
            const std::string cmd  = boost::to_upper_copy(line.substr(0, sp));
            const std::string arg  = sp == std::string::npos ? "" : line.substr(sp + 1);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_commands.push_back(cmd == "PASS" ? "PASS ****" : line);
            }

            if (cmd == "QUIT") {
                reply(stream, "221 Goodbye.");
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_quits;
                break;
            } else if (cmd == "USER") {
                user = arg;
                reply(stream, "331 Please specify the password.");
            } else if (cmd == "PASS") {
                logged_in = user == "bblp" && arg == m_password;
                reply(stream, logged_in ? "230 Login successful." : "530 Login incorrect.");
            } else if (!logged_in) {
                reply(stream, "530 Please login with USER and PASS.");
            } else if (cmd == "PBSZ") {
                reply(stream, "200 PBSZ=0");
            } else if (cmd == "PROT") {
                reply(stream, arg == "P" ? "200 Protection level set to P" : "536 Only P is supported");
            } else if (cmd == "PWD") {
                reply(stream, "257 \"/\" is the current directory");
            } else if (cmd == "TYPE") {
                reply(stream, "200 Switching to Binary mode.");
            } else if (cmd == "SIZE") {
                auto files = this->files();
                auto it    = files.find(arg);
                reply(stream, it == files.end() ? std::string("550 Could not get file size.") : "213 " + std::to_string(it->second.size()));
            } else if (cmd == "PASV") {
                const auto local = stream.next_layer().local_endpoint();
                passive          = std::make_unique<tcp::acceptor>(m_ioc, tcp::endpoint(local.address(), 0));
                const unsigned short port = passive->local_endpoint().port();
                reply(stream, (boost::format("227 Entering Passive Mode (10,255,255,1,%1%,%2%).") % (port / 256) % (port % 256)).str());
            } else if (cmd == "STOR") {
                std::string stor_reply;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    stor_reply = m_stor_reply;
                }
                if (!passive) {
                    reply(stream, "425 Use PASV first.");
                } else if (!stor_reply.empty()) {
                    passive.reset();
                    reply(stream, stor_reply);
                } else {
                    reply(stream, "150 Ok to send data.");
                    auto data = accept_data(*passive);
                    passive.reset();
                    if (!data) {
                        reply(stream, "425 Failed to establish connection.");
                        continue;
                    }

                    std::string              content;
                    std::array<char, 8192>   chunk;
                    boost::system::error_code rec;
                    while (!rec) {
                        const size_t n = data->read_some(net::buffer(chunk), rec);
                        content.append(chunk.data(), n);
                    }
                    // Like vsftpd, accept data connections closed without close_notify.
                    const bool clean = rec == net::error::eof || rec == net::ssl::error::stream_truncated;
                    data->shutdown(rec);
                    data->next_layer().close(rec);

                    if (!clean) {
                        reply(stream, "426 Connection closed; transfer aborted.");
                        continue;
                    }
                    put_file(arg, content);
                    reply(stream, "226 Transfer complete.");
                }
            } else if (cmd == "RETR") {
                auto files = this->files();
                auto it    = files.find(arg);
                if (it == files.end()) {
                    reply(stream, "550 Failed to open file.");
                } else if (!passive) {
                    reply(stream, "425 Use PASV first.");
                } else {
                    reply(stream, "150 Opening BINARY mode data connection.");
                    auto data = accept_data(*passive);
                    passive.reset();
                    if (!data) {
                        reply(stream, "425 Failed to establish connection.");
                        continue;
                    }
                    boost::system::error_code wec;
                    net::write(*data, net::buffer(it->second), wec);
                    data->shutdown(wec);
                    data->next_layer().close(wec);
                    reply(stream, "226 Transfer complete.");
                }
            } else {
                reply(stream, "502 Command not implemented.");
            }
        }
    } catch (const boost::system::system_error&) {
        // Client went away.
    }

    boost::system::error_code ignored;
    stream.next_layer().close(ignored);
}

}} // namespace PandaPrint::test
