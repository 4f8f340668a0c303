#pragma once

#include <stdexcept>
#include <string>

namespace snyk_freq {

/// Missing or invalid run input. Raised before any network call.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// The listing phase failed. No partial project list survives it.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& what, unsigned int httpStatus = 0)
        : std::runtime_error(what)
        , mHttpStatus(httpStatus) {}

    /// 0 when the failure happened below HTTP (network, parse, link).
    unsigned int httpStatus() const { return mHttpStatus; }

private:
    unsigned int mHttpStatus;
};

} // namespace snyk_freq
