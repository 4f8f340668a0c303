#include "cli_options.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace snyk_freq {

namespace {

int parseIntFlag(const std::string& flag, const std::string& value, int minValue) {
    std::size_t consumed = 0;
    int n = 0;
    try {
        n = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || n < minValue) {
        throw ConfigurationError(flag + " expects a number >= " +
                                 std::to_string(minValue) + ", got '" + value + "'");
    }
    return n;
}

void setPreset(CliOptions& opts, TypePreset preset, const std::string& flag) {
    if (opts.preset != TypePreset::None && opts.preset != preset) {
        throw ConfigurationError(
            "Only one of --all-types, --sca, --iac, --container may be given (" +
            flag + " conflicts with the " + toString(opts.preset) + " preset)");
    }
    opts.preset = preset;
}

/// Ask one question; nullopt when prompting is off or input is exhausted.
std::optional<std::string> ask(std::istream* in, std::ostream& out,
                               const std::string& question) {
    if (in == nullptr) return std::nullopt;
    out << question << std::flush;
    std::string line;
    if (!std::getline(*in, line)) return std::nullopt;
    return trim(line);
}

std::string valueOr(const std::optional<std::string>& v) {
    return v ? trim(*v) : std::string();
}

} // namespace

CliOptions parseArgs(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto needValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--org-id") {
            opts.orgId = needValue();
        } else if (arg == "--token") {
            opts.token = needValue();
        } else if (arg == "--frequency") {
            opts.frequency = needValue();
        } else if (arg == "--types") {
            opts.types = needValue();
        } else if (arg == "--all-types") {
            setPreset(opts, TypePreset::All, arg);
        } else if (arg == "--sca") {
            setPreset(opts, TypePreset::OpenSource, arg);
        } else if (arg == "--iac") {
            setPreset(opts, TypePreset::Iac, arg);
        } else if (arg == "--container") {
            setPreset(opts, TypePreset::Container, arg);
        } else if (arg == "--api-host") {
            opts.apiHost = needValue();
        } else if (arg == "--timeout-ms") {
            opts.timeoutMs = parseIntFlag(arg, needValue(), 1);
        } else if (arg == "--max-rate-limit-retries") {
            opts.maxRateLimitRetries = parseIntFlag(arg, needValue(), 0);
        } else if (arg == "--no-prompt") {
            opts.prompt = false;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            throw ConfigurationError("Unknown argument: " + arg);
        }
    }

    if (opts.types && opts.preset != TypePreset::None) {
        throw ConfigurationError("--types cannot be combined with a preset flag");
    }
    return opts;
}

std::string usageText() {
    std::ostringstream os;
    os << "Usage: snyk_freq [options]\n\n"
       << "Sets test_frequency on every project of a Snyk organization.\n\n"
       << "Options:\n"
       << "  --org-id ID                 Organization ID (prompted if absent)\n"
       << "  --token TOKEN               API token (default: $SNYK_TOKEN, else prompted)\n"
       << "  --frequency F               daily | weekly | never (prompted if absent)\n"
       << "  --types a,b,c               Only update projects of these types\n"
       << "  --all-types                 Filter by every allowed project type\n"
       << "  --sca                       Filter by open source project types\n"
       << "  --iac                       Filter by IaC project types\n"
       << "  --container                 Filter by container project types\n"
       << "  --api-host URL              API host (default: https://api.snyk.io)\n"
       << "  --timeout-ms N              HTTP timeout in ms (default: 5000)\n"
       << "  --max-rate-limit-retries N  Give up on a project after N rate-limit\n"
       << "                              retries (default: 0 = retry forever)\n"
       << "  --no-prompt                 Never read from stdin\n"
       << "  --verbose                   Enable verbose diagnostics\n"
       << "  --help, -h                  Show this message\n";
    return os.str();
}

RunConfig resolveRunConfig(const CliOptions& opts,
                           const ProjectTypeCatalog& catalog,
                           const char* envToken,
                           std::istream* in,
                           std::ostream& out)
{
    std::istream* prompt = opts.prompt ? in : nullptr;

    // --- required values ---
    std::string token = valueOr(opts.token);
    if (token.empty() && envToken != nullptr) {
        token = trim(envToken);
    }
    if (token.empty()) {
        token = ask(prompt, out,
                    "Enter your Snyk API token (or set SNYK_TOKEN env var): ")
                    .value_or("");
    }

    std::string orgId = valueOr(opts.orgId);
    if (orgId.empty()) {
        orgId = ask(prompt, out, "Enter your Organization ID: ").value_or("");
    }

    std::string frequencyText = valueOr(opts.frequency);
    if (frequencyText.empty() && prompt != nullptr) {
        out << "Allowed frequency: daily, weekly, never\n";
        frequencyText = ask(prompt, out, "Enter your desired test frequency: ")
                            .value_or("");
    }

    if (token.empty() || orgId.empty() || frequencyText.empty()) {
        throw ConfigurationError(
            "API token, frequency, and organization ID are required");
    }

    const auto frequency = parseFrequency(frequencyText);
    if (!frequency) {
        throw ConfigurationError("Invalid frequency '" + frequencyText +
                                 "' (allowed: daily, weekly, never)");
    }

    RunConfig cfg;
    cfg.orgId     = orgId;
    cfg.apiToken  = token;
    cfg.frequency = *frequency;
    cfg.preset    = opts.preset;
    cfg.verbose   = opts.verbose;

    cfg.api.apiHost             = opts.apiHost;
    cfg.api.timeoutMs           = opts.timeoutMs;
    cfg.api.maxRateLimitRetries = opts.maxRateLimitRetries;

    try {
        parseUrl(cfg.api.apiHost);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("--api-host: ") + e.what());
    }

    // --- type filter ---
    std::optional<std::string> typeInput = opts.types;
    if (opts.preset != TypePreset::None) {
        cfg.types = catalog.presetTypes(opts.preset);
        out << "Filtering by " << toString(opts.preset) << " project types.\n";
        return cfg;
    }

    if (!typeInput && prompt != nullptr) {
        out << "\n--- Project Type Filter (Optional) ---\n"
            << "Allowed types: " << joinComma(catalog.allTypes()) << "\n";
        typeInput = ask(prompt, out,
                        "Enter desired types (comma-separated), or press Enter to skip: ");
    }

    if (!typeInput || trim(*typeInput).empty()) {
        out << "No filter specified. Fetching all project types.\n";
        return cfg;
    }

    const auto selection = catalog.select(*typeInput);
    if (!selection.rejected.empty()) {
        std::cerr << "[Config] Warning: ignoring invalid types: "
                  << joinComma(selection.rejected) << "\n";
    }
    cfg.types = selection.accepted;
    if (cfg.types.empty()) {
        out << "No valid types selected. Fetching all project types.\n";
    } else {
        out << "Filtering by types: " << joinComma(cfg.types) << "\n";
    }
    return cfg;
}

} // namespace snyk_freq
