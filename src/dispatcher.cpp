#include "dispatcher.hpp"
#include "mapping.hpp"

#include <iostream>
#include <stdexcept>

namespace snyk_freq {

UpdateDispatcher::UpdateDispatcher(SnykClient& client,
                                   RequestPacer& pacer,
                                   int maxRateLimitRetries,
                                   bool verbose)
    : mClient(client)
    , mPacer(pacer)
    , mMaxRateLimitRetries(maxRateLimitRetries)
    , mVerbose(verbose) {}

UpdateOutcome UpdateDispatcher::classifyStatus(unsigned int httpStatus) {
    if (httpStatus == 200) return UpdateOutcome::Success;
    if (httpStatus == 429) return UpdateOutcome::RateLimited;
    return UpdateOutcome::Failed;
}

void UpdateDispatcher::report(const Progress& p) const {
    if (mOnProgress) {
        mOnProgress(p);
    }
}

// ---------------------------------------------------------------------------
// Public: update loop
// ---------------------------------------------------------------------------

RunSummary UpdateDispatcher::updateAll(const std::vector<Project>& projects,
                                       const std::string& orgId,
                                       Frequency frequency)
{
    RunSummary summary;
    summary.fetched = projects.size();
    summary.total   = projects.size();

    bool requestIssued = false;

    for (std::size_t i = 0; i < projects.size(); ++i) {
        const Project& project = projects[i];

        Progress p;
        p.index   = i;
        p.total   = projects.size();
        p.project = &project;

        // --- malformed item: terminal without a request ---
        if (!project.hasValidId()) {
            p.outcome = UpdateOutcome::Failed;
            p.attempt = 0;
            p.message = "no project id";
            ++summary.failed;
            std::cerr << "[Dispatcher] Skipping item " << (i + 1)
                      << ": no project id\n";
            report(p);
            continue;
        }

        int consecutiveRateLimits = 0;
        for (int attempt = 1; ; ++attempt) {
            if (requestIssued && consecutiveRateLimits == 0) {
                mPacer.pauseBetweenRequests();
            }
            requestIssued = true;

            p.attempt    = attempt;
            p.httpStatus = 0;
            p.message.clear();

            if (mVerbose) {
                std::cerr << "[Dispatcher] PATCH " << project.id
                          << " test_frequency=" << toString(frequency)
                          << " (attempt " << attempt << ")\n";
            }

            try {
                const auto resp =
                    mClient.patchTestFrequency(orgId, project.id, frequency);
                p.httpStatus = resp.httpStatus;
                p.outcome    = classifyStatus(resp.httpStatus);
                if (p.outcome == UpdateOutcome::Failed) {
                    p.message = "HTTP " + std::to_string(resp.httpStatus) +
                                ": " + describeErrorBody(resp.body);
                }
            } catch (const std::exception& e) {
                p.outcome = UpdateOutcome::Failed;
                p.message = std::string("Network error: ") + e.what();
            }

            if (p.outcome != UpdateOutcome::RateLimited) {
                break;
            }

            ++consecutiveRateLimits;
            if (mMaxRateLimitRetries > 0 &&
                consecutiveRateLimits > mMaxRateLimitRetries) {
                p.outcome = UpdateOutcome::Failed;
                p.message = "still rate limited after " +
                            std::to_string(mMaxRateLimitRetries) + " retries";
                break;
            }

            ++summary.rateLimitRetries;
            report(p);
            mPacer.pauseAfterRateLimit();
        }

        // --- terminal classification ---
        if (p.outcome == UpdateOutcome::Success) {
            ++summary.updated;
        } else {
            ++summary.failed;
            std::cerr << "[Dispatcher] Update failed for " << project.id
                      << ": " << p.message << "\n";
        }
        report(p);
    }

    return summary;
}

} // namespace snyk_freq
