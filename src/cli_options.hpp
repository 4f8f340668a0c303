#pragma once

#include "models.hpp"
#include "project_types.hpp"
#include "settings.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace snyk_freq {

/// Raw command-line input, before validation.
struct CliOptions {
    std::optional<std::string> orgId;
    std::optional<std::string> token;
    std::optional<std::string> frequency;
    std::optional<std::string> types;       // --types a,b,c
    TypePreset                 preset = TypePreset::None;

    std::string apiHost             = ApiSettings{}.apiHost;
    int         timeoutMs           = ApiSettings{}.timeoutMs;
    int         maxRateLimitRetries = 0;
    bool        prompt              = true;
    bool        verbose             = false;
    bool        help                = false;
};

/// Fully validated input of one run. Nothing downstream re-checks it.
struct RunConfig {
    std::string              orgId;
    std::string              apiToken;
    Frequency                frequency = Frequency::Weekly;
    std::vector<std::string> types;     // allow-listed only, empty = no filter
    TypePreset               preset = TypePreset::None;
    ApiSettings              api;
    bool                     verbose = false;
};

/// @throws ConfigurationError on unknown flags, missing flag values,
///         bad numbers, or conflicting filter flags.
CliOptions parseArgs(int argc, const char* const argv[]);

std::string usageText();

/// Fill gaps from the environment token and, if @p in is non-null and
/// prompting is enabled, from interactive answers; then validate.
/// Prompts and notices go to @p out.
/// @throws ConfigurationError when a required value is missing or invalid.
RunConfig resolveRunConfig(const CliOptions& opts,
                           const ProjectTypeCatalog& catalog,
                           const char* envToken,
                           std::istream* in,
                           std::ostream& out);

} // namespace snyk_freq
