#include "pacer.hpp"

#include <iostream>
#include <thread>
#include <utility>

namespace snyk_freq {

RequestPacer::RequestPacer(std::chrono::milliseconds interRequestDelay,
                           std::chrono::milliseconds rateLimitDelay,
                           Sleeper sleeper)
    : mInterRequestDelay(interRequestDelay)
    , mRateLimitDelay(rateLimitDelay)
    , mSleeper(std::move(sleeper))
{
    if (!mSleeper) {
        mSleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void RequestPacer::pauseBetweenRequests() {
    ++mInterRequestPauses;
    sleep(mInterRequestDelay);
}

void RequestPacer::pauseAfterRateLimit() {
    ++mRateLimitPauses;
    std::cerr << "[Pacer] Rate limit hit: pausing for "
              << mRateLimitDelay.count() << " ms\n";
    sleep(mRateLimitDelay);
}

double RequestPacer::totalSleepSeconds() const {
    return std::chrono::duration<double>(mTotalSleep).count();
}

void RequestPacer::sleep(std::chrono::milliseconds d) {
    if (d.count() <= 0) return;
    mTotalSleep += d;
    mSleeper(d);
}

} // namespace snyk_freq
