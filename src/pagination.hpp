#pragma once

#include "models.hpp"
#include "pacer.hpp"
#include "snyk_client.hpp"

#include <string>
#include <vector>

namespace snyk_freq {

/// Follows links.next through the projects listing and collects every page.
/// All-or-nothing: any failing page aborts the whole fetch with FetchError.
class ProjectPaginator {
public:
    struct Stats {
        int totalFetched      = 0;
        int totalRequests     = 0;
        int pagesFetched      = 0;
        int duplicatesDropped = 0;
    };

    ProjectPaginator(SnykClient& client,
                     RequestPacer& pacer,
                     bool verbose = false);

    /// Fetch every project of @p orgId, optionally restricted to @p types.
    /// Projects keep server order, page after page.
    /// @throws FetchError on any HTTP, network, body or link failure.
    std::vector<Project> fetchAllProjects(const std::string& orgId,
                                          const std::vector<std::string>& types);

    Stats getStats() const { return mStats; }

private:
    SnykClient&   mClient;
    RequestPacer& mPacer;
    bool          mVerbose;
    Stats         mStats{};
};

} // namespace snyk_freq
