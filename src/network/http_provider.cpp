#include "network/http_provider.hpp"
#include "common/storage_error.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/err.h>

namespace zgs {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Runs the queued async operation to completion and rearms the context
void run_pending(net::io_context& ioc) {
    ioc.run();
    ioc.restart();
}

template <typename Stream>
http::response<http::string_body> exchange(net::io_context& ioc, Stream& stream,
                                           const http::request<http::string_body>& req,
                                           beast::tcp_stream& lowest,
                                           std::chrono::milliseconds timeout) {
    beast::error_code ec;

    lowest.expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    if (ec) {
        throw beast::system_error(ec);
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(timeout);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    if (ec) {
        throw beast::system_error(ec);
    }
    return res;
}

void connect(net::io_context& ioc, beast::tcp_stream& stream, const ParsedUrl& url,
             std::chrono::milliseconds timeout) {
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(url.host, url.port);

    beast::error_code ec;
    stream.expires_after(timeout);
    stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_pending(ioc);
    if (ec) {
        throw beast::system_error(ec);
    }
}

} // namespace

//===========================================================================
// Envelope helpers
//===========================================================================

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string rest = url;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parsed.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    } else {
        parsed.scheme = "http";
    }

    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    parsed.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    auto port_sep = authority.rfind(':');
    if (port_sep != std::string::npos && authority.find(']', port_sep) == std::string::npos) {
        parsed.host = authority.substr(0, port_sep);
        parsed.port = authority.substr(port_sep + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }

    if (parsed.host.empty()) {
        throw std::invalid_argument("missing host in url '" + url + "'");
    }
    return parsed;
}

nlohmann::json make_rpc_request(const std::string& method, const nlohmann::json& params) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", method}
    };
    if (!params.is_null()) {
        payload["params"] = params;
    }
    return payload;
}

nlohmann::json unwrap_rpc_response(const nlohmann::json& response) {
    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        std::string message = "Unknown error";
        int code = 0;
        if (error->is_object()) {
            message = error->value("message", message);
            code = error->value("code", 0);
        } else if (error->is_string()) {
            message = error->get<std::string>();
        }
        throw RpcError(message, code);
    }

    auto result = response.find("result");
    if (result == response.end()) {
        return nlohmann::json();
    }
    return *result;
}

//===========================================================================
// HttpProvider
//===========================================================================

HttpProvider::HttpProvider(const std::string& url, std::chrono::milliseconds timeout)
    : url_(url), parsed_(parse_url(url)), timeout_(timeout) {
    if (parsed_.scheme != "http" && parsed_.scheme != "https") {
        throw std::invalid_argument("unsupported url scheme '" + parsed_.scheme + "'");
    }
}

std::string HttpProvider::post(const std::string& body) {
    http::request<http::string_body> req{http::verb::post, parsed_.target, 11};
    req.set(http::field::host, parsed_.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();

    net::io_context ioc;
    http::response<http::string_body> res;

    if (parsed_.scheme == "https") {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed_.host.c_str())) {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        net::error::get_ssl_category()));
        }

        connect(ioc, beast::get_lowest_layer(stream), parsed_, timeout_);

        beast::error_code ec;
        beast::get_lowest_layer(stream).expires_after(timeout_);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        run_pending(ioc);
        if (ec) {
            throw beast::system_error(ec);
        }

        res = exchange(ioc, stream, req, beast::get_lowest_layer(stream), timeout_);

        // Servers commonly drop the connection without close_notify
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    } else {
        beast::tcp_stream stream(ioc);
        connect(ioc, stream, parsed_, timeout_);
        res = exchange(ioc, stream, req, stream, timeout_);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    if (res.result_int() < 200 || res.result_int() >= 300) {
        throw NodeUnavailableError(url_, "HTTP status " + std::to_string(res.result_int()));
    }
    return res.body();
}

nlohmann::json HttpProvider::request(const std::string& method, const nlohmann::json& params) {
    std::string body = make_rpc_request(method, params).dump();
    BOOST_LOG_TRIVIAL(trace) << "HTTP provider: " << url_ << " <- " << method;

    std::string response_body;
    try {
        response_body = post(body);
    }
    catch (const beast::system_error& e) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP provider: " << method << " to " << url_
                                 << " failed: " << e.code().message();
        throw NodeUnavailableError(url_, e.code().message());
    }

    nlohmann::json response = nlohmann::json::parse(response_body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw NodeUnavailableError(url_, "invalid JSON-RPC response for " + method);
    }
    return unwrap_rpc_response(response);
}

} // namespace network
} // namespace zgs
