#pragma once

#include "http_transport.hpp"
#include "models.hpp"
#include "settings.hpp"

#include <string>
#include <vector>

namespace snyk_freq {

/// Snyk REST endpoints used by the run: list projects, patch one project.
/// Adds the version parameter and authorization headers to every request.
class SnykClient {
public:
    SnykClient(HttpTransport& transport,
               ApiSettings settings,
               std::string apiToken);

    /// First page URL of the organization's project listing.
    /// @param types  allow-listed types, empty for no filter
    std::string projectsUrl(const std::string& orgId,
                            const std::vector<std::string>& types) const;

    /// Resolve a links.next value against the API host.
    /// @throws std::invalid_argument for unusable links.
    std::string resolveNext(const std::string& link) const;

    HttpResponse getPage(const std::string& url);

    HttpResponse patchTestFrequency(const std::string& orgId,
                                    const std::string& projectId,
                                    Frequency frequency);

    const ApiSettings& settings() const { return mSettings; }

private:
    HttpTransport& mTransport;
    ApiSettings    mSettings;
    std::string    mApiToken;

    std::string orgBase(const std::string& orgId) const;
};

} // namespace snyk_freq
