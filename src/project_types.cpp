#include "project_types.hpp"
#include "util.hpp"

#include <algorithm>
#include <utility>

namespace snyk_freq {

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

ProjectTypeCatalog::ProjectTypeCatalog(std::vector<std::string> openSource,
                                       std::vector<std::string> codeAnalysis,
                                       std::vector<std::string> iac,
                                       std::vector<std::string> container)
    : mOpenSource(std::move(openSource))
    , mCodeAnalysis(std::move(codeAnalysis))
    , mIac(std::move(iac))
    , mContainer(std::move(container))
{
    for (const auto* group : {&mOpenSource, &mCodeAnalysis, &mIac, &mContainer}) {
        for (const auto& t : *group) {
            if (!contains(mAll, t)) mAll.push_back(t);
        }
    }
}

ProjectTypeCatalog ProjectTypeCatalog::standard() {
    return ProjectTypeCatalog(
        {"nuget", "paket", "cpp", "hex", "golangdep", "govendor", "gomodules",
         "maven", "gradle", "npm", "pnpm", "yarn", "composer", "pip", "pipenv",
         "poetry", "rubygems", "sbt", "cocoapods"},
        {"sast"},
        {"terraformconfig", "cloudformationconfig", "k8sconfig",
         "helmconfig", "armconfig"},
        {"apk", "deb", "rpm", "linux", "dockerfile"});
}

bool ProjectTypeCatalog::isAllowed(const std::string& type) const {
    return contains(mAll, type);
}

std::vector<std::string> ProjectTypeCatalog::presetTypes(TypePreset preset) const {
    switch (preset) {
        case TypePreset::All:        return mAll;
        case TypePreset::OpenSource: return mOpenSource;
        case TypePreset::Iac:        return mIac;
        case TypePreset::Container:  return mContainer;
        case TypePreset::None:       break;
    }
    return {};
}

TypeSelection ProjectTypeCatalog::select(const std::string& commaSeparated) const {
    return select(splitComma(commaSeparated));
}

TypeSelection ProjectTypeCatalog::select(const std::vector<std::string>& types) const {
    TypeSelection sel;
    for (const auto& raw : types) {
        const std::string trimmed = trim(raw);
        if (trimmed.empty()) continue;

        const std::string t = toLower(trimmed);
        if (isAllowed(t)) {
            if (!contains(sel.accepted, t)) sel.accepted.push_back(t);
        } else {
            sel.rejected.push_back(trimmed);
        }
    }
    return sel;
}

bool ProjectTypeCatalog::includesWeeklyOnlyTypes(
    const std::vector<std::string>& filter) const
{
    if (filter.empty()) return true;
    return std::any_of(filter.begin(), filter.end(), [this](const std::string& t) {
        return contains(mCodeAnalysis, t) || contains(mIac, t);
    });
}

std::optional<Frequency> parseFrequency(const std::string& text) {
    const std::string f = toLower(trim(text));
    if (f == "daily")  return Frequency::Daily;
    if (f == "weekly") return Frequency::Weekly;
    if (f == "never")  return Frequency::Never;
    return std::nullopt;
}

const char* toString(TypePreset preset) {
    switch (preset) {
        case TypePreset::None:       return "none";
        case TypePreset::All:        return "all";
        case TypePreset::OpenSource: return "open-source";
        case TypePreset::Iac:        return "iac";
        case TypePreset::Container:  return "container";
    }
    return "none";
}

} // namespace snyk_freq
