#include "HttpServer.hpp"
#include "PrintAPI.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"

#include <algorithm>
#include <optional>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/v6_only.hpp>

namespace PandaPrint {

namespace {

const std::chrono::seconds READ_TIMEOUT{300};
const std::chrono::seconds WRITE_TIMEOUT{30};

// One client connection. Reads requests one at a time and answers them in order.
class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket&& socket, PrintAPI& api) : m_stream(std::move(socket)), m_api(api) {}

    void run() { net::dispatch(m_stream.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this())); }

private:
    void do_read()
    {
        m_parser.emplace();
        m_parser->body_limit(MAX_REQUEST_BODY);
        m_stream.expires_after(READ_TIMEOUT);
        http::async_read(m_stream, m_buffer, *m_parser, beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, size_t)
    {
        if (ec == http::error::end_of_stream)
            return do_close();
        if (ec) {
            if (ec != net::error::operation_aborted)
                BOOST_LOG_TRIVIAL(debug) << "HttpSession - read: " << ec.message();
            return;
        }

        HttpRequest req = m_parser->release();
        BOOST_LOG_TRIVIAL(debug) << boost::format("HttpSession - %1% %2% (%3% bytes)") % req.method_string() % req.target() %
                                        req.body().size();
        m_response = std::make_shared<HttpResponse>(m_api.handle_request(req));
        BOOST_LOG_TRIVIAL(info) << boost::format("HttpSession - %1% %2% -> %3%") % req.method_string() % req.target() %
                                       m_response->result_int();

        m_stream.expires_after(WRITE_TIMEOUT);
        http::async_write(m_stream, *m_response,
                          beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), m_response->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, size_t)
    {
        if (ec) {
            BOOST_LOG_TRIVIAL(debug) << "HttpSession - write: " << ec.message();
            return;
        }
        m_response.reset();
        if (close)
            return do_close();
        do_read();
    }

    void do_close()
    {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream                                      m_stream;
    beast::flat_buffer                                     m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    std::shared_ptr<HttpResponse>                          m_response;
    PrintAPI&                                              m_api;
};

} // namespace

HttpServer::HttpServer(PrintAPI& api, const std::string& address, unsigned short port, unsigned int threads)
    : m_api(api), m_address(address), m_port(port), m_thread_count(std::max(1u, threads)), m_acceptor(m_ioc)
{}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::start()
{
    if (m_running.exchange(true))
        return;

    beast::error_code ec;
    const auto        address = net::ip::make_address(m_address, ec);
    if (ec)
        throw IOError("Invalid listen address \"" + m_address + "\": " + ec.message());

    const tcp::endpoint endpoint(address, m_port);
    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec && address.is_v6())
        // Accept IPv4 clients too when listening on an IPv6 address.
        m_acceptor.set_option(net::ip::v6_only(false), ec);
    if (!ec)
        m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec)
        m_acceptor.bind(endpoint, ec);
    if (!ec)
        m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        m_running.store(false);
        beast::error_code ignored;
        m_acceptor.close(ignored);
        throw IOError((boost::format("Cannot listen on [%1%]:%2%: %3%") % m_address % m_port % ec.message()).str());
    }

    m_port = m_acceptor.local_endpoint().port();
    BOOST_LOG_TRIVIAL(info) << boost::format("HttpServer - listening on [%1%]:%2% with %3% threads") % m_address % m_port %
                                   m_thread_count;

    do_accept();
    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i)
        m_threads.emplace_back([this]() {
            try {
                m_ioc.run();
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "HttpServer - worker stopped: " << e.what();
            }
        });
}

void HttpServer::do_accept()
{
    m_acceptor.async_accept(net::make_strand(m_ioc), beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket)
{
    if (ec == net::error::operation_aborted || !m_acceptor.is_open())
        return;
    if (ec)
        BOOST_LOG_TRIVIAL(warning) << "HttpServer - accept: " << ec.message();
    else
        std::make_shared<HttpSession>(std::move(socket), m_api)->run();
    do_accept();
}

void HttpServer::stop()
{
    if (!m_running.exchange(false))
        return;

    m_ioc.stop();
    for (auto& thread : m_threads)
        if (thread.joinable())
            thread.join();
    m_threads.clear();

    beast::error_code ignored;
    m_acceptor.close(ignored);
    BOOST_LOG_TRIVIAL(info) << "HttpServer - stopped";
}

} // namespace PandaPrint
