#pragma once

#include "http_transport.hpp"
#include "pacer.hpp"

#include <iosfwd>

namespace snyk_freq {

constexpr int kExitOk          = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitFetchError  = 2;
constexpr int kExitFatal       = 3;

/// Parse the command line, resolve the config, fetch the matching projects
/// and update each one. Progress and the summary go to @p out, errors to @p err.
///
/// Nothing is updated unless the whole listing succeeded. Failed updates do
/// not change the exit code; they are counted in the summary.
///
/// @param transport  nullptr builds a BeastTransport from the resolved config
/// @param sleeper    passed to the RequestPacer; empty sleeps for real
/// @return kExitOk, kExitConfigError, kExitFetchError or kExitFatal
int runCli(int argc, const char* const argv[],
           const char* envToken,
           std::istream* in,
           std::ostream& out,
           std::ostream& err,
           HttpTransport* transport = nullptr,
           RequestPacer::Sleeper sleeper = RequestPacer::Sleeper());

} // namespace snyk_freq
