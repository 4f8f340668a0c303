#pragma once

#include <chrono>
#include <functional>

namespace snyk_freq {

/// Blocking fixed-delay pacing between API requests.
/// Not adaptive: the same two delays are used for the whole run.
class RequestPacer {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// @param interRequestDelay  pause between consecutive requests
    /// @param rateLimitDelay     pause after an HTTP 429
    /// @param sleeper            defaults to std::this_thread::sleep_for
    RequestPacer(std::chrono::milliseconds interRequestDelay,
                 std::chrono::milliseconds rateLimitDelay,
                 Sleeper sleeper = Sleeper());

    void pauseBetweenRequests();
    void pauseAfterRateLimit();

    // ---- accessors for summary report ----
    double totalSleepSeconds() const;
    int    interRequestPauses() const { return mInterRequestPauses; }
    int    rateLimitPauses()    const { return mRateLimitPauses; }

private:
    std::chrono::milliseconds mInterRequestDelay;
    std::chrono::milliseconds mRateLimitDelay;
    Sleeper                   mSleeper;

    std::chrono::milliseconds mTotalSleep{0};
    int                       mInterRequestPauses = 0;
    int                       mRateLimitPauses    = 0;

    void sleep(std::chrono::milliseconds d);
};

} // namespace snyk_freq
