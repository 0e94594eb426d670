#ifndef pandaprint_HttpServer_hpp_
#define pandaprint_HttpServer_hpp_

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = boost::asio::ip::tcp;

namespace PandaPrint {

class PrintAPI;

// Largest request body accepted, uploads included.
constexpr uint64_t MAX_REQUEST_BODY = 1024ull * 1024 * 1024;

// HTTP/1.1 server handing every request to the PrintAPI. Requests are handled
// on a pool of worker threads, each one synchronously.
class HttpServer
{
public:
    HttpServer(PrintAPI& api, const std::string& address, unsigned short port, unsigned int threads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds, listens and starts the worker threads. Throws IOError when the address cannot be bound.
    void start();
    void stop();

    // Bound port, useful when constructed with port 0.
    unsigned short port() const { return m_port; }

private:
    void do_accept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    PrintAPI&                m_api;
    std::string              m_address;
    unsigned short           m_port;
    unsigned int             m_thread_count;
    net::io_context          m_ioc;
    tcp::acceptor            m_acceptor;
    std::vector<std::thread> m_threads;
    std::atomic<bool>        m_running{false};
};

} // namespace PandaPrint

#endif // pandaprint_HttpServer_hpp_
