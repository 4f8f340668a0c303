#pragma once

#include <string>
#include <utility>
#include <vector>

namespace snyk_freq {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path plus query (e.g. "/rest/orgs/x/projects?limit=100")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Turn a links.next value into an absolute URL.
/// Absolute http(s) URLs pass through, "/path" is appended to @p apiHost.
/// Throws std::invalid_argument for anything else.
std::string resolveLink(const std::string& apiHost, const std::string& link);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string percentEncode(const std::string& value);

/// Build "?k1=v1&k2=v2" with percent-encoded keys and values. Empty input gives "".
std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params);

std::string trim(const std::string& s);
std::string toLower(std::string s);

std::vector<std::string> splitComma(const std::string& s);
std::string joinComma(const std::vector<std::string>& parts);

} // namespace snyk_freq
