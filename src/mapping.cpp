#include "mapping.hpp"

#include <stdexcept>

namespace snyk_freq {

namespace {

constexpr std::size_t kMaxErrorBodyChars = 300;

std::string stringField(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

} // namespace

Project parseProjectNode(const nlohmann::json& node) {
    Project p;
    if (!node.is_object()) {
        p.name = "Unknown Name";
        return p;
    }

    // A non-string or missing id leaves the project without a usable id.
    p.id = stringField(node, "id");

    if (node.contains("attributes") && node["attributes"].is_object()) {
        p.attributes = node["attributes"];
        p.name       = stringField(p.attributes, "name");
        p.type       = stringField(p.attributes, "type");
    }
    if (p.name.empty()) {
        p.name = "Unknown Name";
    }
    return p;
}

ProjectsPage parseProjectsPage(const nlohmann::json& responseBody) {
    ProjectsPage result;

    if (!responseBody.is_object()) {
        throw std::runtime_error("Response body is not a JSON object");
    }

    // --- data ---
    if (responseBody.contains("data")) {
        const auto& data = responseBody["data"];
        if (data.is_array()) {
            for (const auto& node : data) {
                result.projects.push_back(parseProjectNode(node));
            }
        } else if (!data.is_null()) {
            throw std::runtime_error("Response 'data' field is not an array");
        }
    }

    // --- links.next ---
    if (responseBody.contains("links") && responseBody["links"].is_object()) {
        std::string next = stringField(responseBody["links"], "next");
        if (!next.empty()) {
            result.nextLink = std::move(next);
        }
    }

    return result;
}

nlohmann::json buildFrequencyPatch(const std::string& projectId,
                                   Frequency frequency) {
    return {
        {"data", {
            {"type", "project"},
            {"id", projectId},
            {"relationships", nlohmann::json::object()},
            {"attributes", {
                {"test_frequency", toString(frequency)}
            }}
        }}
    };
}

std::vector<std::string>
extractApiErrors(const nlohmann::json& responseBody) {
    std::vector<std::string> errors;

    if (responseBody.is_object() && responseBody.contains("errors") &&
        responseBody["errors"].is_array()) {
        for (const auto& err : responseBody["errors"]) {
            std::string msg = stringField(err, "detail");
            if (msg.empty()) msg = stringField(err, "title");
            if (msg.empty()) msg = "Unknown API error";
            errors.push_back(std::move(msg));
        }
    }
    return errors;
}

std::string describeErrorBody(const std::string& body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded()) {
        const auto errors = extractApiErrors(parsed);
        if (!errors.empty()) {
            std::string joined;
            for (const auto& e : errors) {
                if (!joined.empty()) joined += "; ";
                joined += e;
            }
            return joined;
        }
    }

    if (body.size() <= kMaxErrorBodyChars) {
        return body;
    }
    return body.substr(0, kMaxErrorBodyChars) + " ...(truncated)";
}

} // namespace snyk_freq
