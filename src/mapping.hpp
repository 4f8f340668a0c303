#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace snyk_freq {

/// Result of parsing one page of the projects listing.
struct ProjectsPage {
    std::vector<Project>       projects;
    std::optional<std::string> nextLink;   // links.next, unresolved
};

/// Parse a JSON:API projects listing body into a ProjectsPage.
/// Throws std::runtime_error if the expected shape is missing.
ProjectsPage parseProjectsPage(const nlohmann::json& responseBody);

/// Map a single resource object from data[] into a Project.
Project parseProjectNode(const nlohmann::json& node);

/// PATCH body that sets attributes.test_frequency on one project.
nlohmann::json buildFrequencyPatch(const std::string& projectId,
                                   Frequency frequency);

/// Human-readable messages from a JSON:API "errors" array (may be empty).
std::vector<std::string> extractApiErrors(const nlohmann::json& responseBody);

/// Best-effort one-line description of an error response body:
/// the API error messages if it parses, else the raw text truncated.
std::string describeErrorBody(const std::string& body);

} // namespace snyk_freq
