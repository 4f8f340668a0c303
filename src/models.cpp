#include "models.hpp"

namespace snyk_freq {

const char* toString(Frequency frequency) {
    switch (frequency) {
        case Frequency::Daily:  return "daily";
        case Frequency::Weekly: return "weekly";
        case Frequency::Never:  return "never";
    }
    return "never";
}

const char* toString(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::Success:     return "success";
        case UpdateOutcome::Failed:      return "failed";
        case UpdateOutcome::RateLimited: return "rate-limited";
    }
    return "failed";
}

} // namespace snyk_freq
