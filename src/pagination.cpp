#include "pagination.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace snyk_freq {

namespace {

/// Strip scheme/host and query for log lines.
std::string friendlyPath(const std::string& url, const std::string& apiHost) {
    std::string path = url;
    if (path.rfind(apiHost, 0) == 0) {
        path = path.substr(apiHost.size());
    }
    auto q = path.find('?');
    return q == std::string::npos ? path : path.substr(0, q);
}

} // namespace

ProjectPaginator::ProjectPaginator(SnykClient& client,
                                   RequestPacer& pacer,
                                   bool verbose)
    : mClient(client)
    , mPacer(pacer)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: paginated fetch
// ---------------------------------------------------------------------------

std::vector<Project>
ProjectPaginator::fetchAllProjects(const std::string& orgId,
                                   const std::vector<std::string>& types)
{
    mStats = Stats{};

    std::vector<Project> allProjects;
    std::unordered_set<std::string> seenIds;
    std::unordered_set<std::string> visitedUrls;

    std::optional<std::string> nextUrl = mClient.projectsUrl(orgId, types);

    while (nextUrl) {
        const std::string url = *nextUrl;
        nextUrl.reset();

        if (!visitedUrls.insert(url).second) {
            throw FetchError("Pagination loop: next link repeats " +
                             friendlyPath(url, mClient.settings().apiHost));
        }

        // --- pacing gate between consecutive pages ---
        if (mStats.totalRequests > 0) {
            mPacer.pauseBetweenRequests();
        }

        if (mVerbose) {
            std::cerr << "[Paginator] Fetching page: "
                      << friendlyPath(url, mClient.settings().apiHost) << "\n";
        }

        HttpResponse resp;
        try {
            resp = mClient.getPage(url);
        } catch (const std::exception& e) {
            throw FetchError(std::string("Network error while listing projects: ") +
                             e.what());
        }
        ++mStats.totalRequests;

        if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
            throw FetchError("Listing projects failed with HTTP " +
                             std::to_string(resp.httpStatus) + ": " +
                             describeErrorBody(resp.body),
                             resp.httpStatus);
        }

        ProjectsPage page;
        try {
            page = parseProjectsPage(nlohmann::json::parse(resp.body));
        } catch (const std::exception& e) {
            throw FetchError(std::string("Failed to parse projects page: ") +
                             e.what(), resp.httpStatus);
        }
        ++mStats.pagesFetched;

        for (auto& project : page.projects) {
            if (project.hasValidId() && !seenIds.insert(project.id).second) {
                ++mStats.duplicatesDropped;
                std::cerr << "[Paginator] Warning: dropping duplicate project id "
                          << project.id << "\n";
                continue;
            }
            allProjects.push_back(std::move(project));
        }

        if (mVerbose) {
            std::cerr << "[Paginator] Got " << page.projects.size()
                      << " projects (total so far: "
                      << allProjects.size() << ")\n";
        }

        if (page.nextLink) {
            try {
                nextUrl = mClient.resolveNext(*page.nextLink);
            } catch (const std::invalid_argument& e) {
                throw FetchError(std::string("Bad pagination link: ") + e.what());
            }
        } else if (mVerbose) {
            std::cerr << "[Paginator] No more pages.\n";
        }
    }

    mStats.totalFetched = static_cast<int>(allProjects.size());
    return allProjects;
}

} // namespace snyk_freq
