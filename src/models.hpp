#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace snyk_freq {

/// Mirrors a Snyk REST project resource (subset of fields used in the update run).
struct Project {
    std::string    id;          // empty when the resource had no usable id
    std::string    name;        // attributes.name, "Unknown Name" when absent
    std::string    type;        // attributes.type, e.g. "npm", "sast"
    nlohmann::json attributes = nlohmann::json::object();

    bool hasValidId() const { return !id.empty(); }
};

/// Value written to the project's test_frequency attribute.
enum class Frequency {
    Daily,
    Weekly,
    Never
};

/// Terminal or transient classification of one update attempt.
enum class UpdateOutcome {
    Success,
    Failed,
    RateLimited
};

struct RunSummary {
    std::size_t fetched          = 0;
    std::size_t updated          = 0;
    std::size_t failed           = 0;
    std::size_t total            = 0;
    std::size_t rateLimitRetries = 0;
};

const char* toString(Frequency frequency);
const char* toString(UpdateOutcome outcome);

} // namespace snyk_freq
