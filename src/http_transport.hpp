#pragma once

#include <string>
#include <utility>
#include <vector>

namespace snyk_freq {

enum class HttpMethod {
    Get,
    Patch
};

struct HttpRequest {
    HttpMethod  method = HttpMethod::Get;
    std::string url;    // absolute http(s) URL
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    unsigned int httpStatus = 0;
    std::string  body;
};

/// One synchronous request/response exchange.
/// Implementations throw on network-level failure (resolve, connect, TLS,
/// timeout); any HTTP status, including 4xx/5xx, is returned normally.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// HttpTransport built on Boost.Beast. Opens one connection per request.
class BeastTransport : public HttpTransport {
public:
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit BeastTransport(int timeoutMs = 5000);

    /// @throws std::runtime_error / boost::system::system_error on network errors.
    HttpResponse send(const HttpRequest& request) override;

    void setVerbose(bool v) { mVerbose = v; }

    /// Trust an extra PEM-encoded CA certificate on top of the system store.
    /// The server certificate must still match the request host.
    void addCertificateAuthority(std::string pem);

private:
    int  mTimeoutMs;
    bool mVerbose = false;
    std::vector<std::string> mExtraAuthorities;

    HttpResponse doHttpRequest(const std::string& host,
                               const std::string& port,
                               const std::string& target,
                               const HttpRequest& request);
    HttpResponse doHttpsRequest(const std::string& host,
                                const std::string& port,
                                const std::string& target,
                                const HttpRequest& request);
};

} // namespace snyk_freq
