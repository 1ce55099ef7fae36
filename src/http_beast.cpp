#include <coincidence/http.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>

#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace beast = boost::beast; // from <boost/beast.hpp>
namespace http = beast::http;   // from <boost/beast/http.hpp>
namespace net = boost::asio;    // from <boost/asio.hpp>
namespace ssl = net::ssl;       // from <boost/asio/ssl.hpp>
using tcp = net::ip::tcp;       // from <boost/asio/ip/tcp.hpp>
namespace url = boost::urls;

namespace coincidence {

namespace {

// Static object to hold io_context, mutex for thread safety, and connection cache
struct BackendState {
    net::io_context ioc;
    std::mutex mtx;
    std::unordered_map<std::string, std::variant<beast::tcp_stream, beast::ssl_stream<beast::tcp_stream>>> connection_cache;
    static BackendState& instance()
    {
        static BackendState state;
        return state;
    }
    static void tls_info_callback(const SSL* ssl, int where, int ret)
    {
        if (where & SSL_CB_ALERT) {
            if ((ret>>8) == SSL3_AL_WARNING && (ret&0xff) == SSL_AD_CLOSE_NOTIFY) {
                std::lock_guard<std::mutex> lock(BackendState::instance().mtx);
                auto socket = (net::ip::tcp::socket*)SSL_CTX_get_ex_data(SSL_get_SSL_CTX(ssl), 1);
                boost::system::error_code ignored;
                socket->close(ignored);
            }
        }
    }
};

// Helper class to parse URL and extract components
struct URL {
    URL(std::string_view url_str)
    {
        auto url_result = url::parse_uri(url_str);
        if (!url_result) {
            throw std::invalid_argument("Invalid URL format: " + std::string(url_str));
        }
        url::url_view url = *url_result;
        tls = (url.scheme_id() == url::scheme::https);
        port = url.port();
        if (port.empty()) {
            port = tls ? "443" : "80";
        }
        host = url.host();
        // keep percent-encoding so titles such as Caf%C3%A9 reach the server unchanged
        target = url.encoded_target();
        if (target.empty() || target[0] != '/') {
            target.insert(0, "/");
        }
    }
    std::string host, target;
    std::string port;
    bool tls;
};

template<typename StreamType>
struct LoanedConnection
{
    LoanedConnection(URL const& url)
    : url(url)
    {
        connect();
    }
    void request(std::span<HTTP::Header const> headers)
    {
        req = http::request<http::empty_body>{http::verb::get, url.target, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::user_agent, "coincidence-http-client");
        req.set(http::field::connection, "keep-alive");
        req.set(http::field::keep_alive, "timeout=3600");
        for (const auto& [key, value] : headers) {
            req.set(std::string(key), std::string(value));
        }
        http::write(*stream, req);
    }
    HTTP::Response http_response(std::span<HTTP::Header const> headers)
    {
        http::response<http::dynamic_body> res;
        try {
            request(headers);
            http::read(*stream, buffer, res);
        } catch (boost::system::system_error & se) {
            if (res.body().size() == 0 && buffer.size() == 0) {
                // a cached connection may have been closed by the server while idle
                switch (se.code().value()) {
                default:
                    throw;
                case net::error::no_permission:
                case net::error::eof:
                case net::error::connection_reset:
                case net::error::broken_pipe:
                    connect(true);
                    request(headers);
                    http::read(*stream, buffer, res);
                }
            } else {
                throw;
            }
        }

        keep_alive = res.keep_alive();
        auto location = res[http::field::location];
        auto reason = res.reason();
        return {
            res.result_int(),
            std::string(reason.data(), reason.size()),
            std::string(location.data(), location.size()),
            beast::buffers_to_string(res.body().data())
        };
    }
    ~LoanedConnection()
    {
        if (!keep_alive || !stream || !connected()) {
            return;
        }
        std::lock_guard<std::mutex> lock(BackendState::instance().mtx);
        auto it = BackendState::instance().connection_cache.find(key);
        if (it != BackendState::instance().connection_cache.end()) {
            // because we know this one is connected, erasing the other is reasonable
            BackendState::instance().connection_cache.erase(it);
        }
        it = BackendState::instance().connection_cache.emplace(key, std::move(*stream)).first;
        if constexpr (std::is_same_v<StreamType, beast::ssl_stream<beast::tcp_stream>>) {
            StreamType & streamref = std::get<StreamType>(it->second);
            SSL_CTX_set_ex_data(SSL_get_SSL_CTX(streamref.native_handle()), 1, &socket(streamref));
        }
    }

    URL url;
    std::string key;
    std::optional<StreamType> stream;
    http::request<http::empty_body> req;
    beast::flat_buffer buffer;
    bool keep_alive = false;
private:
    void connect(bool fresh = false)
    {
        net::io_context& ioc = BackendState::instance().ioc;
        {
            std::stringstream ss;
            ss << (url.tls ? "https://" : "http://") << url.host << ":" << url.port;
            key = ss.str();
        }
        buffer.clear();
        // Check if connection is cached
        if (!fresh) {
            std::lock_guard<std::mutex> lock(BackendState::instance().mtx);
            auto it = BackendState::instance().connection_cache.find(key);
            if (it != BackendState::instance().connection_cache.end()) {
                if (std::holds_alternative<StreamType>(it->second)) {
                    stream.emplace(std::move(std::get<StreamType>(it->second)));
                    if constexpr (std::is_same_v<StreamType, beast::ssl_stream<beast::tcp_stream>>) {
                        SSL_CTX_set_ex_data(SSL_get_SSL_CTX(stream->native_handle()), 1, &socket(*stream));
                    }
                    BackendState::instance().connection_cache.erase(it);
                    if (connected()) { return; }
                }
            }
        }
        auto const results = tcp::resolver(ioc).resolve(url.host, url.port);
        if constexpr (std::is_same_v<StreamType, beast::ssl_stream<beast::tcp_stream>>) {
            ssl::context ctx{ssl::context::tlsv12_client};
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);
            stream.emplace(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream->native_handle(), url.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            stream->set_verify_callback(ssl::host_name_verification(url.host));
            SSL_CTX_set_ex_data(ctx.native_handle(), 1, &socket(*stream));
            SSL_CTX_set_info_callback(ctx.native_handle(), BackendState::tls_info_callback);
            net::connect(socket(*stream), results.begin(), results.end());
            socket(*stream).set_option(net::socket_base::keep_alive(true));
            stream->handshake(ssl::stream_base::client);
        } else {
            stream.emplace(ioc);
            net::connect(socket(*stream), results.begin(), results.end());
            socket(*stream).set_option(net::socket_base::keep_alive(true));
        }
    }

    bool connected() {
        auto & socket = this->socket(*stream);
        if (!socket.is_open()) {
            return false;
        }
        int sockfd = socket.native_handle();
        if (sockfd == -1) {
            return false;
        }
        int error = 0;
        socklen_t len = sizeof(error);
        int r = getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &error, &len);
        if (r != 0 || error != 0) {
            return false;
        }
        struct tcp_info tcp_info;
        len = sizeof(tcp_info);
        r = getsockopt(sockfd, SOL_TCP, TCP_INFO, &tcp_info, &len);
        if (r == 0 && tcp_info.tcpi_state == TCP_CLOSE_WAIT) {
            return false;
        }
        return true;
    }

    static auto & socket(StreamType& stream) {
        if constexpr (std::is_same_v<StreamType, beast::ssl_stream<beast::tcp_stream>>) {
            return stream.next_layer().socket();
        } else if constexpr (std::is_same_v<StreamType, beast::tcp_stream>) {
            return stream.socket();
        }
    }
};

} // namespace

HTTP::Response HTTP::request(std::string_view url_str, std::span<Header const> headers) {
    URL url{url_str};
    if (url.tls) {
        LoanedConnection<beast::ssl_stream<beast::tcp_stream>> loan(url);
        return loan.http_response(headers);
    } else {
        LoanedConnection<beast::tcp_stream> loan(url);
        return loan.http_response(headers);
    }
}

std::string HTTP::request_string(std::string_view url_str, std::span<Header const> headers) {
    Response res = request(url_str, headers);
    if (res.status / 100 != 2) {
        std::stringstream ss;
        ss << "HTTP " << res.status << " " << res.reason << " from " << url_str << ": " << res.body;
        throw std::runtime_error(ss.str());
    }
    return std::move(res.body);
}

} // namespace coincidence
