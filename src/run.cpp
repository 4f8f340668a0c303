#include "run.hpp"

#include "cli_options.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "pagination.hpp"
#include "project_types.hpp"
#include "snyk_client.hpp"

#include <iomanip>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace snyk_freq {

namespace {

void printProgress(std::ostream& out, const UpdateDispatcher::Progress& p) {
    const std::string counter =
        "  [" + std::to_string(p.index + 1) + "/" + std::to_string(p.total) + "] ";

    if (!p.project->hasValidId()) {
        out << counter << "Skipping item, no project ID found.\n";
        return;
    }

    switch (p.outcome) {
        case UpdateOutcome::RateLimited:
            out << counter << p.project->name << ": rate limited, retrying"
                << " (attempt " << p.attempt << ")\n";
            break;
        case UpdateOutcome::Success:
            out << counter << "Updated " << p.project->name
                << " (ID: " << p.project->id << ")\n";
            break;
        case UpdateOutcome::Failed:
            out << counter << "Failed " << p.project->name
                << " (ID: " << p.project->id << "): " << p.message << "\n";
            break;
    }
}

/// Fetch-then-update with a validated config.
/// @throws FetchError when listing fails; no update is sent then.
void runUpdate(const RunConfig& cfg,
               HttpTransport& transport,
               RequestPacer::Sleeper sleeper,
               std::ostream& out)
{
    SnykClient   client(transport, cfg.api, cfg.apiToken);
    RequestPacer pacer(cfg.api.interRequestDelay, cfg.api.rateLimitDelay,
                       std::move(sleeper));

    out << "\nFetching projects for Organization ID: " << cfg.orgId << "...\n";
    ProjectPaginator paginator(client, pacer, cfg.verbose);
    const auto projects = paginator.fetchAllProjects(cfg.orgId, cfg.types);

    out << "Found " << projects.size() << " matching projects.\n";
    if (projects.empty()) {
        out << "No projects to update.\n";
        return;
    }

    out << "\nSetting test frequency to '" << toString(cfg.frequency) << "'...\n";
    UpdateDispatcher dispatcher(client, pacer, cfg.api.maxRateLimitRetries,
                                cfg.verbose);
    dispatcher.setProgressCallback(
        [&out](const UpdateDispatcher::Progress& p) { printProgress(out, p); });
    const RunSummary summary =
        dispatcher.updateAll(projects, cfg.orgId, cfg.frequency);

    out << "\n=== Update Complete ===\n"
        << "Successfully updated: " << summary.updated          << "\n"
        << "Failed to update:     " << summary.failed           << "\n"
        << "Total projects:       " << summary.total            << "\n"
        << "Rate-limit retries:   " << summary.rateLimitRetries << "\n"
        << "Pages fetched:        " << paginator.getStats().pagesFetched << "\n"
        << "Total sleep (s):      " << std::fixed << std::setprecision(2)
                                    << pacer.totalSleepSeconds() << "\n"
        << "=======================\n";
}

} // namespace

int runCli(int argc, const char* const argv[],
           const char* envToken,
           std::istream* in,
           std::ostream& out,
           std::ostream& err,
           HttpTransport* transport,
           RequestPacer::Sleeper sleeper)
{
    try {
        const CliOptions opts = parseArgs(argc, argv);
        if (opts.help) {
            out << usageText();
            return kExitOk;
        }

        out << "=== Snyk Project Test Frequency Updater ===\n\n";

        const ProjectTypeCatalog catalog = ProjectTypeCatalog::standard();
        const RunConfig cfg = resolveRunConfig(opts, catalog, envToken, in, out);

        if (cfg.frequency == Frequency::Daily &&
            catalog.includesWeeklyOnlyTypes(cfg.types)) {
            out << "Note: SAST and IaC projects can only be set to weekly "
                   "or never; those updates may be rejected.\n";
        }

        std::unique_ptr<BeastTransport> owned;
        if (transport == nullptr) {
            owned.reset(new BeastTransport(cfg.api.timeoutMs));
            owned->setVerbose(cfg.verbose);
            transport = owned.get();
        }

        runUpdate(cfg, *transport, std::move(sleeper), out);
        return kExitOk;

    } catch (const ConfigurationError& e) {
        err << "Configuration error: " << e.what() << "\n\n" << usageText();
        return kExitConfigError;
    } catch (const FetchError& e) {
        err << "Failed to retrieve projects: " << e.what() << "\n";
        return kExitFetchError;
    } catch (const std::exception& e) {
        err << "Fatal error: " << e.what() << "\n";
        return kExitFatal;
    }
}

} // namespace snyk_freq
