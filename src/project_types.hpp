#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace snyk_freq {

/// Named project-type groups selectable from the command line.
enum class TypePreset {
    None,
    All,
    OpenSource,
    Iac,
    Container
};

/// Outcome of validating a user-supplied type list against the allow-list.
struct TypeSelection {
    std::vector<std::string> accepted;   // allow-listed, lower-cased, de-duplicated
    std::vector<std::string> rejected;   // as typed (trimmed), never sent to the server
};

/// Immutable allow-list of project types and the preset groups over it.
/// Build once with standard() and pass it to whoever needs it.
class ProjectTypeCatalog {
public:
    ProjectTypeCatalog(std::vector<std::string> openSource,
                       std::vector<std::string> codeAnalysis,
                       std::vector<std::string> iac,
                       std::vector<std::string> container);

    /// Catalog matching the Snyk project types accepted by the projects endpoint.
    static ProjectTypeCatalog standard();

    bool isAllowed(const std::string& type) const;

    /// Every allow-listed type, grouped in catalog order.
    const std::vector<std::string>& allTypes() const { return mAll; }

    std::vector<std::string> presetTypes(TypePreset preset) const;

    /// Split, trim, lower-case and validate a comma-separated list.
    TypeSelection select(const std::string& commaSeparated) const;
    TypeSelection select(const std::vector<std::string>& types) const;

    /// True when the filter can match projects that refuse a daily schedule
    /// (SAST and IaC). An empty filter matches everything.
    bool includesWeeklyOnlyTypes(const std::vector<std::string>& filter) const;

private:
    std::vector<std::string> mOpenSource;
    std::vector<std::string> mCodeAnalysis;
    std::vector<std::string> mIac;
    std::vector<std::string> mContainer;
    std::vector<std::string> mAll;
};

/// Parse "daily" / "weekly" / "never" (case-insensitive, trimmed).
std::optional<Frequency> parseFrequency(const std::string& text);

const char* toString(TypePreset preset);

} // namespace snyk_freq
