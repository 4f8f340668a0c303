#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace snyk_freq {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string resolveLink(const std::string& apiHost, const std::string& link) {
    if (link.empty()) {
        throw std::invalid_argument("Empty pagination link");
    }

    const std::string lower = toLower(link.substr(0, 8));
    if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0) {
        // The token travels with every request: never leave the API origin.
        const auto target = parseUrl(link);
        const auto origin = parseUrl(apiHost);
        if (target.scheme != origin.scheme ||
            toLower(target.host) != toLower(origin.host) ||
            target.port != origin.port) {
            throw std::invalid_argument("Pagination link leaves the API origin: " + link);
        }
        return link;
    }

    if (link.front() == '/') {
        std::string host = apiHost;
        while (!host.empty() && host.back() == '/') {
            host.pop_back();
        }
        return host + link;
    }

    throw std::invalid_argument("Unsupported pagination link: " + link);
}

std::string percentEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params)
{
    std::string query;
    for (const auto& kv : params) {
        query += query.empty() ? '?' : '&';
        query += percentEncode(kv.first);
        query += '=';
        query += percentEncode(kv.second);
    }
    return query;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitComma(const std::string& s) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto comma = s.find(',', start);
        parts.push_back(s.substr(start, comma - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return parts;
}

std::string joinComma(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ',';
        out += p;
    }
    return out;
}

} // namespace snyk_freq
