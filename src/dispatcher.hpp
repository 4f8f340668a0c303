#pragma once

#include "models.hpp"
#include "pacer.hpp"
#include "snyk_client.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace snyk_freq {

/// Applies one test_frequency update per project, in order.
///
/// Per project: no id -> Failed without a request; HTTP 200 -> Success;
/// HTTP 429 -> pause for the rate-limit delay and retry the same project;
/// anything else, including network errors -> Failed. Failures never stop
/// the run. Retries on 429 are unbounded unless a cap is configured, so a
/// server that never lifts its limit stalls the run on that project.
class UpdateDispatcher {
public:
    /// Reported once per retry and once per terminal classification.
    struct Progress {
        std::size_t    index = 0;     // 0-based position in the input
        std::size_t    total = 0;
        const Project* project = nullptr;
        UpdateOutcome  outcome = UpdateOutcome::Failed;
        unsigned int   httpStatus = 0;   // 0 when no response was received
        int            attempt = 1;
        std::string    message;          // failure reason, empty on success
    };

    using ProgressCallback = std::function<void(const Progress&)>;

    /// @param maxRateLimitRetries  consecutive 429s tolerated per project, 0 = no cap
    UpdateDispatcher(SnykClient& client,
                     RequestPacer& pacer,
                     int maxRateLimitRetries = 0,
                     bool verbose = false);

    void setProgressCallback(ProgressCallback cb) { mOnProgress = std::move(cb); }

    /// Returns once every project reached Success or Failed.
    RunSummary updateAll(const std::vector<Project>& projects,
                         const std::string& orgId,
                         Frequency frequency);

    static UpdateOutcome classifyStatus(unsigned int httpStatus);

private:
    SnykClient&      mClient;
    RequestPacer&    mPacer;
    int              mMaxRateLimitRetries;
    bool             mVerbose;
    ProgressCallback mOnProgress;

    void report(const Progress& p) const;
};

} // namespace snyk_freq
