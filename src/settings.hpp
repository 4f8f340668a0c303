#pragma once

#include <chrono>
#include <string>

namespace snyk_freq {

/// Fixed REST API parameters and pacing delays for one run.
struct ApiSettings {
    std::string apiHost    = "https://api.snyk.io";
    std::string basePath   = "/rest";
    std::string apiVersion = "2024-05-23";
    int         pageLimit  = 100;
    int         timeoutMs  = 5000;

    std::chrono::milliseconds interRequestDelay{50};
    std::chrono::milliseconds rateLimitDelay{10000};

    /// Consecutive 429 retries allowed per project; 0 retries forever.
    int maxRateLimitRetries = 0;
};

} // namespace snyk_freq
