#include "scoreflow/utils/serialization.h"
#include <cmath>

namespace scoreflow {
namespace utils {

using nlohmann::json;

namespace {
    Error malformed(const std::string& field, const std::string& problem) {
        return Error{ErrorCode::InvalidConfiguration, "Field '" + field + "' " + problem};
    }

    json optionalString(const std::optional<std::string>& value) {
        return value ? json(*value) : json(nullptr);
    }

    std::optional<std::string> readOptionalString(const json& j, const char* field) {
        if (!j.contains(field) || j.at(field).is_null()) {
            return std::nullopt;
        }
        return j.at(field).get<std::string>();
    }

    json coverageToJson(const core::Coverage& coverage) {
        json out = json::array();
        if (std::holds_alternative<core::Coverage::All>(coverage.selection)) {
            out.push_back("all");
        } else if (const auto* include = std::get_if<core::Coverage::Include>(&coverage.selection)) {
            out.push_back("include");
            for (const auto& id : include->ids) out.push_back(id);
        } else if (const auto* exclude = std::get_if<core::Coverage::Exclude>(&coverage.selection)) {
            out.push_back("exclude");
            for (const auto& id : exclude->ids) out.push_back(id);
        }
        return out;
    }

    Result<core::Coverage> coverageFromJson(const json& j) {
        if (!j.is_array() || j.empty() || !j[0].is_string()) {
            return malformed("coverage", "must be an array starting with 'all', 'include' or 'exclude'");
        }
        const auto mode = j[0].get<std::string>();
        std::vector<std::string> ids;
        for (std::size_t i = 1; i < j.size(); ++i) {
            ids.push_back(j[i].get<std::string>());
        }
        if (mode == "all") return core::Coverage::all();
        if (mode == "include") return core::Coverage::include(std::move(ids));
        if (mode == "exclude") return core::Coverage::exclude(std::move(ids));
        return malformed("coverage", "has unknown mode '" + mode + "'");
    }

    json ruleToJson(const core::Rule& rule) {
        json out = json::array({rule.name});
        for (const auto& param : rule.params) {
            if (const auto* number = std::get_if<double>(&param)) {
                out.push_back(*number);
            } else {
                out.push_back(std::get<std::string>(param));
            }
        }
        return out;
    }

    Result<core::Rule> ruleFromJson(const json& j) {
        core::Rule rule;
        if (j.is_null()) {
            return rule;
        }
        if (!j.is_array()) {
            return malformed("rule", "must be an array of a name and parameters");
        }
        if (!j.empty()) {
            rule.name = j[0].get<std::string>();
        }
        for (std::size_t i = 1; i < j.size(); ++i) {
            if (j[i].is_number()) {
                rule.params.emplace_back(j[i].get<double>());
            } else if (j[i].is_string()) {
                rule.params.emplace_back(j[i].get<std::string>());
            } else {
                return malformed("rule", "parameter " + std::to_string(i) + " is neither a number nor a string");
            }
        }
        return rule;
    }

    json valueToJson(const core::ScoreValue& value) {
        return value ? json(*value) : json(nullptr);
    }

    core::ScoreValue valueFromJson(const json& j) {
        if (j.is_null()) return std::nullopt;
        return j.get<double>();
    }
}

json metricToJson(const core::MetricDefinition& metric) {
    json out{
        {"id", metric.id},
        {"name", metric.name},
        {"level", core::toString(metric.level)},
        {"scope", optionalString(metric.scope)},
        {"coverage", coverageToJson(metric.coverage)},
        {"rule", ruleToJson(metric.rule)},
        {"submetric", optionalString(metric.submetric)},
        {"tagWeights", metric.tagWeights ? json(*metric.tagWeights) : json(nullptr)},
        {"timeFilter", json::array({metric.timeFilter.start, metric.timeFilter.end})},
        {"multiples", core::toString(metric.multiples)},
        {"submissionKind", optionalString(metric.submissionKind)},
        {"autoCompute", metric.autoCompute},
        {"visibleToStudent", metric.visibleToStudent},
        {"revision", metric.revision}
    };
    if (metric.lastUpdated) {
        out["lastUpdated"] = *metric.lastUpdated;
    }
    return out;
}

Result<core::MetricDefinition> metricFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidConfiguration, "Metric definition must be a JSON object"};
    }
    try {
        core::MetricDefinition metric;
        if (!j.contains("name")) {
            return malformed("name", "is required");
        }
        metric.name = j.at("name").get<std::string>();
        metric.id = j.value("id", metric.name);

        if (!j.contains("level")) {
            return malformed("level", "is required");
        }
        auto level = core::parseLevel(j.at("level").get<std::string>());
        if (!level) {
            return malformed("level", "must be program, namespace, lesson or component");
        }
        metric.level = *level;
        metric.scope = readOptionalString(j, "scope");

        if (j.contains("coverage")) {
            auto coverage = coverageFromJson(j.at("coverage"));
            if (coverage.has_error()) return coverage.error();
            metric.coverage = coverage.value();
        }
        if (j.contains("rule")) {
            auto rule = ruleFromJson(j.at("rule"));
            if (rule.has_error()) return rule.error();
            metric.rule = rule.value();
        }

        metric.submetric = readOptionalString(j, "submetric");
        if (j.contains("tagWeights") && !j.at("tagWeights").is_null()) {
            metric.tagWeights = j.at("tagWeights").get<std::map<std::string, double>>();
        }

        if (j.contains("timeFilter")) {
            const auto& filter = j.at("timeFilter");
            if (!filter.is_array() || filter.size() != 2) {
                return malformed("timeFilter", "must be an array of start and end");
            }
            // Documents may store bounds as floating point (3.1536e14)
            metric.timeFilter.start = static_cast<core::EpochMillis>(std::llround(filter[0].get<double>()));
            metric.timeFilter.end = static_cast<core::EpochMillis>(std::llround(filter[1].get<double>()));
        }

        if (j.contains("multiples")) {
            auto multiples = core::parseMultiplesPolicy(j.at("multiples").get<std::string>());
            if (!multiples) {
                return malformed("multiples", "must be last, first, max or pass-through");
            }
            metric.multiples = *multiples;
        }

        metric.submissionKind = readOptionalString(j, "submissionKind");
        metric.autoCompute = j.value("autoCompute", false);
        metric.visibleToStudent = j.value("visibleToStudent", false);
        if (j.contains("lastUpdated") && !j.at("lastUpdated").is_null()) {
            metric.lastUpdated = j.at("lastUpdated").get<core::EpochMillis>();
        }
        metric.revision = j.value("revision", std::uint64_t{0});
        return metric;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidConfiguration, std::string("Malformed metric definition: ") + e.what()};
    }
}

Result<std::vector<core::MetricDefinition>> metricsFromJson(const json& j) {
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidConfiguration, "Metric list must be a JSON array"};
    }
    std::vector<core::MetricDefinition> metrics;
    metrics.reserve(j.size());
    for (const auto& entry : j) {
        auto metric = metricFromJson(entry);
        if (metric.has_error()) {
            return metric.error();
        }
        metrics.push_back(std::move(metric.value()));
    }
    return metrics;
}

json scoreToJson(const core::Score& score) {
    json contributions = json::array();
    for (const auto& c : score.contributions) {
        contributions.push_back({
            {"item", c.itemId},
            {"value", valueToJson(c.value)},
            {"tag", optionalString(c.tag)},
            {"weight", c.weight}
        });
    }
    json j{
        {"metric", score.key.metricId},
        {"learner", score.key.learnerId},
        {"scope", score.key.scopeId},
        {"value", valueToJson(score.value)},
        {"computedAt", score.computedAt},
        {"sourceGeneration", score.sourceGeneration},
        {"contributions", contributions}
    };
    j["sourceTime"] = score.sourceTime ? json(*score.sourceTime) : json(nullptr);
    return j;
}

Result<core::Score> scoreFromJson(const json& j) {
    try {
        core::Score score;
        score.key.metricId = j.at("metric").get<std::string>();
        score.key.learnerId = j.at("learner").get<std::string>();
        score.key.scopeId = j.value("scope", std::string());
        score.value = valueFromJson(j.at("value"));
        score.computedAt = j.at("computedAt").get<core::EpochMillis>();
        score.sourceGeneration = j.value("sourceGeneration", std::uint64_t{0});
        if (j.contains("sourceTime") && !j.at("sourceTime").is_null()) {
            score.sourceTime = j.at("sourceTime").get<core::EpochMillis>();
        }
        if (j.contains("contributions")) {
            for (const auto& c : j.at("contributions")) {
                score.contributions.push_back(core::Contribution{
                    c.at("item").get<std::string>(),
                    valueFromJson(c.at("value")),
                    readOptionalString(c, "tag"),
                    c.value("weight", 0.0)
                });
            }
        }
        return score;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidConfiguration, std::string("Malformed score: ") + e.what()};
    }
}

Result<json> parseJson(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidConfiguration, std::string("Invalid JSON: ") + e.what()};
    }
}

} // namespace utils
} // namespace scoreflow
