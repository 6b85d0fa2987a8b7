#include "scoreflow/core/aggregation_engine.h"
#include "scoreflow/core/engine_config.h"
#include "scoreflow/core/in_memory_stores.h"
#include "scoreflow/core/recompute_scheduler.h"
#include "scoreflow/utils/serialization.h"
#include <chrono>
#include <iostream>

using namespace scoreflow;
using namespace scoreflow::core;

int main(int argc, char** argv) {
    // Optional engine configuration file
    EngineConfig config;
    if (argc > 1) {
        auto loaded = EngineConfig::fromFile(argv[1]);
        if (loaded.has_error()) {
            std::cerr << loaded.error().describe() << "\n";
            return 1;
        }
        config = loaded.value();
    }
    config.applyLogLevel();

    // A small course: one namespace, a homework lesson and an exam lesson
    auto catalog = std::make_shared<InMemoryContentCatalog>();
    catalog->addItem({"intro", Level::Namespace, std::nullopt, std::nullopt});
    catalog->addItem({"week1", Level::Lesson, std::string("intro"), std::string("homework")});
    catalog->addItem({"final", Level::Lesson, std::string("intro"), std::string("exam")});
    catalog->addItem({"week1-q1", Level::Component, std::string("week1"), std::nullopt});
    catalog->addItem({"week1-q2", Level::Component, std::string("week1"), std::nullopt});
    catalog->addItem({"final-q1", Level::Component, std::string("final"), std::nullopt});

    auto definitions = std::make_shared<InMemoryMetricDefinitionStore>();
    auto parsed = utils::parseJson(R"([
        {"name": "attempt", "level": "component", "rule": ["average"], "multiples": "max", "autoCompute": true},
        {"name": "lesson", "level": "lesson", "rule": ["average"], "submetric": "attempt", "autoCompute": true},
        {"name": "course", "level": "namespace", "scope": "intro", "rule": ["average"],
         "submetric": "lesson", "tagWeights": {"homework": 3, "exam": 1}, "autoCompute": true}
    ])");
    if (parsed.has_error()) {
        std::cerr << parsed.error().describe() << "\n";
        return 1;
    }
    auto metrics = utils::metricsFromJson(parsed.value());
    if (metrics.has_error()) {
        std::cerr << metrics.error().describe() << "\n";
        return 1;
    }
    for (const auto& metric : metrics.value()) {
        definitions->put(metric);
    }

    auto feed = std::make_shared<InMemorySubmissionFeed>();
    auto scores = std::make_shared<InMemoryScoreStore>();
    auto engine = std::make_shared<AggregationEngine>(catalog, feed, definitions, scores,
                                                      RuleRegistry::withBuiltinRules(), config);

    auto results = engine->validator().validateAll();
    if (results.has_error()) {
        std::cerr << results.error().describe() << "\n";
        return 1;
    }

    RecomputeScheduler scheduler(engine, config);
    auto started = scheduler.start();
    if (started.has_error()) {
        std::cerr << started.error().describe() << "\n";
        return 1;
    }

    // Record some attempts; the scheduler recomputes affected scores
    const EpochMillis now = nowMillis();
    for (const auto& submission : {
             Submission{"alice", "week1-q1", now, 40, std::nullopt, "completed"},
             Submission{"alice", "week1-q1", now + 1, 90, std::nullopt, "completed"},
             Submission{"alice", "final-q1", now + 2, 60, std::nullopt, "completed"},
             Submission{"bob", "week1-q2", now + 3, 70, std::nullopt, "completed"}}) {
        feed->append(submission);
        scheduler.onSubmission(submission);
    }

    if (!scheduler.waitUntilIdle(std::chrono::seconds(10))) {
        std::cerr << "Recomputation did not settle\n";
        return 1;
    }
    scheduler.stop();

    std::cout << "Course scores:\n";
    for (const auto& learner : {"alice", "bob"}) {
        auto score = scores->find({"course", learner, "intro"});
        if (score.has_error() || !score.value()) {
            std::cout << "- " << learner << ": not computed\n";
            continue;
        }
        std::cout << utils::scoreToJson(*score.value()).dump(2) << "\n";
    }

    auto stats = scheduler.stats();
    std::cout << "Runs: " << stats.runsStarted << " started, " << stats.eventsCoalesced
              << " events coalesced\n";
    return 0;
}
