#include "api/NativeHTTPClient.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <regex>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

http::request<http::string_body> buildRequest(const std::string& method,
                                              const std::string& host,
                                              const std::string& target,
                                              const std::string& body,
                                              const std::map<std::string, std::string>& headers)
{
    http::request<http::string_body> req;
    req.method(method == "POST" ? http::verb::post : http::verb::get);
    req.target(target);
    req.version(11);
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "StrangleSeller/1.0");

    for (const auto& [key, value] : headers) {
        req.set(key, value);
    }

    if (!body.empty()) {
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

template <typename Stream>
void exchange(Stream& stream, const http::request<http::string_body>& req,
              NativeHTTPClient::Response& response)
{
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024); // master dumps are large
    http::read(stream, buffer, parser);
    http::response<http::string_body> res = parser.release();

    response.statusCode = res.result_int();
    response.body = res.body();
    for (auto const& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.success = (response.statusCode >= 200 && response.statusCode < 300);
    if (!response.success) {
        response.error = "HTTP " + std::to_string(response.statusCode);
    }
}

} // namespace

NativeHTTPClient::NativeHTTPClient()
    : m_timeout(30)
{
}

void NativeHTTPClient::setTimeout(int seconds)
{
    m_timeout = seconds;
}

NativeHTTPClient::Response NativeHTTPClient::get(const std::string& url,
                                                 const std::map<std::string, std::string>& headers)
{
    return makeRequest("GET", url, "", headers);
}

NativeHTTPClient::Response NativeHTTPClient::post(const std::string& url,
                                                  const std::string& body,
                                                  const std::map<std::string, std::string>& headers)
{
    return makeRequest("POST", url, body, headers);
}

NativeHTTPClient::Response NativeHTTPClient::makeRequest(const std::string& method,
                                                         const std::string& url,
                                                         const std::string& body,
                                                         const std::map<std::string, std::string>& headers)
{
    Response response;

    // Parse URL: protocol://host:port/path
    static const std::regex urlRegex(R"(^(https?)://([^:/]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        response.error = "Invalid URL format: " + url;
        return response;
    }

    const std::string protocol = match[1].str();
    const std::string host = match[2].str();
    std::string port = match[3].str();
    std::string target = match[4].str();

    if (target.empty()) target = "/";
    if (port.empty()) {
        port = (protocol == "https") ? "443" : "80";
    }

    const auto timeout = std::chrono::seconds(m_timeout);
    auto req = buildRequest(method, host, target, body, headers);

    // Own io_context per request: job threads never wait on each other here
    net::io_context ioc;

    try {
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(host, port);

        if (protocol == "https") {
            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_none);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

            // SNI
            if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "Failed to set SNI hostname");
            }

            beast::get_lowest_layer(stream).expires_after(timeout);
            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);

            exchange(stream, req, response);

            // Servers often drop the connection without close_notify
            beast::error_code ec;
            stream.shutdown(ec);
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout);
            stream.connect(results);

            exchange(stream, req, response);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    } catch (std::exception const& e) {
        response.error = e.what();
        response.success = false;
    }

    return response;
}
