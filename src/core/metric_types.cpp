#include "scoreflow/core/metric_types.h"
#include <algorithm>
#include <chrono>
#include <functional>
#include <sstream>

namespace scoreflow {
namespace core {

EpochMillis nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* toString(Level level) {
    switch (level) {
        case Level::Component: return "component";
        case Level::Lesson: return "lesson";
        case Level::Namespace: return "namespace";
        case Level::Program: return "program";
    }
    return "unknown";
}

std::optional<Level> parseLevel(const std::string& name) {
    if (name == "component") return Level::Component;
    if (name == "lesson") return Level::Lesson;
    if (name == "namespace") return Level::Namespace;
    if (name == "program") return Level::Program;
    return std::nullopt;
}

const char* toString(MultiplesPolicy policy) {
    switch (policy) {
        case MultiplesPolicy::Last: return "last";
        case MultiplesPolicy::First: return "first";
        case MultiplesPolicy::Max: return "max";
        case MultiplesPolicy::PassThrough: return "pass-through";
    }
    return "unknown";
}

std::optional<MultiplesPolicy> parseMultiplesPolicy(const std::string& name) {
    if (name == "last") return MultiplesPolicy::Last;
    if (name == "first") return MultiplesPolicy::First;
    if (name == "max") return MultiplesPolicy::Max;
    if (name == "pass-through") return MultiplesPolicy::PassThrough;
    return std::nullopt;
}

std::string Coverage::canonical() const {
    std::ostringstream out;
    if (std::holds_alternative<All>(selection)) {
        out << "all";
    } else if (const auto* inc = std::get_if<Include>(&selection)) {
        auto ids = inc->ids;
        std::sort(ids.begin(), ids.end());
        out << "include";
        for (const auto& id : ids) out << ',' << id;
    } else if (const auto* exc = std::get_if<Exclude>(&selection)) {
        auto ids = exc->ids;
        std::sort(ids.begin(), ids.end());
        out << "exclude";
        for (const auto& id : ids) out << ',' << id;
    }
    return out.str();
}

std::string ScoreKey::toString() const {
    std::string out = metricId + "/" + learnerId;
    if (!scopeId.empty()) {
        out += "@" + scopeId;
    }
    return out;
}

std::size_t ScoreKeyHash::operator()(const ScoreKey& key) const {
    std::hash<std::string> hasher;
    std::size_t seed = hasher(key.metricId);
    seed ^= hasher(key.learnerId) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= hasher(key.scopeId) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

} // namespace core
} // namespace scoreflow
