#include "snyk_client.hpp"
#include "mapping.hpp"
#include "util.hpp"

namespace snyk_freq {

namespace {

constexpr const char* kJsonApiMediaType = "application/vnd.api+json";

} // namespace

SnykClient::SnykClient(HttpTransport& transport,
                       ApiSettings settings,
                       std::string apiToken)
    : mTransport(transport)
    , mSettings(std::move(settings))
    , mApiToken(std::move(apiToken)) {}

std::string SnykClient::orgBase(const std::string& orgId) const {
    std::string host = mSettings.apiHost;
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    return host + mSettings.basePath + "/orgs/" + percentEncode(orgId);
}

std::string SnykClient::projectsUrl(const std::string& orgId,
                                    const std::vector<std::string>& types) const
{
    std::string url = orgBase(orgId) + "/projects" + buildQueryString({
        {"version", mSettings.apiVersion},
        {"limit", std::to_string(mSettings.pageLimit)}
    });

    if (!types.empty()) {
        std::vector<std::string> encoded;
        encoded.reserve(types.size());
        for (const auto& t : types) {
            encoded.push_back(percentEncode(t));
        }
        url += "&types=" + joinComma(encoded);
    }
    return url;
}

std::string SnykClient::resolveNext(const std::string& link) const {
    return resolveLink(mSettings.apiHost, link);
}

HttpResponse SnykClient::getPage(const std::string& url) {
    HttpRequest req;
    req.method  = HttpMethod::Get;
    req.url     = url;
    req.headers = {
        {"Authorization", "token " + mApiToken},
        {"Accept", kJsonApiMediaType}
    };
    return mTransport.send(req);
}

HttpResponse SnykClient::patchTestFrequency(const std::string& orgId,
                                            const std::string& projectId,
                                            Frequency frequency)
{
    HttpRequest req;
    req.method  = HttpMethod::Patch;
    req.url     = orgBase(orgId) + "/projects/" + percentEncode(projectId) +
                  buildQueryString({{"version", mSettings.apiVersion}});
    req.headers = {
        {"Authorization", "token " + mApiToken},
        {"Content-Type", kJsonApiMediaType},
        {"Accept", kJsonApiMediaType}
    };
    req.body = buildFrequencyPatch(projectId, frequency).dump();
    return mTransport.send(req);
}

} // namespace snyk_freq
