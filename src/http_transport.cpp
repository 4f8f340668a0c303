#include "http_transport.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef SNYK_FREQ_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/version.hpp>
#if BOOST_VERSION >= 107300
#include <boost/asio/ssl/host_name_verification.hpp>
#else
#include <boost/asio/ssl/rfc2818_verification.hpp>
#endif
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace snyk_freq {

namespace {

const char* methodName(HttpMethod method) {
    return method == HttpMethod::Patch ? "PATCH" : "GET";
}

http::request<http::string_body> buildRequest(const std::string& host,
                                              const std::string& target,
                                              const HttpRequest& request)
{
    const http::verb verb =
        request.method == HttpMethod::Patch ? http::verb::patch : http::verb::get;

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "snyk_freq/1.0");
    for (const auto& h : request.headers) {
        req.set(h.first, h.second);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(int timeoutMs)
    : mTimeoutMs(timeoutMs) {}

void BeastTransport::addCertificateAuthority(std::string pem) {
    mExtraAuthorities.push_back(std::move(pem));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request) {
    const auto parts = parseUrl(request.url);

    if (mVerbose) {
        std::cerr << "[Transport] " << methodName(request.method) << " "
                  << parts.host << ":" << parts.port << parts.target << "\n";
        if (!request.body.empty()) {
            std::cerr << "[Transport] Body: " << request.body << "\n";
        }
    }

    if (parts.scheme == "https") {
        return doHttpsRequest(parts.host, parts.port, parts.target, request);
    }
    return doHttpRequest(parts.host, parts.port, parts.target, request);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const std::string& host,
                                           const std::string& port,
                                           const std::string& target,
                                           const HttpRequest& request)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(host, port);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(host, target, request);

    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    HttpResponse response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[Transport] HTTP " << response.httpStatus << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const std::string& host,
                                            const std::string& port,
                                            const std::string& target,
                                            const HttpRequest& request)
{
#ifdef SNYK_FREQ_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    for (const auto& pem : mExtraAuthorities) {
        ctx.add_certificate_authority(net::buffer(pem.data(), pem.size()));
    }
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    // Chain verification alone accepts any trusted certificate; pin it to host.
#if BOOST_VERSION >= 107300
    stream.set_verify_callback(ssl::host_name_verification(host));
#else
    stream.set_verify_callback(ssl::rfc2818_verification(host));
#endif

    auto const results = resolver.resolve(host, port);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(host, target, request);

    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    HttpResponse response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());

    if (mVerbose) {
        std::cerr << "[Transport] HTTPS " << response.httpStatus << "\n";
    }

    // Servers often drop the connection without close_notify.
    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)host;
    (void)port;
    (void)target;
    (void)request;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace snyk_freq
