#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "FakeTransport.hpp"
#include "api/ModelComparison.hpp"
#include "api/PredictionOrchestrator.hpp"
#include "threadpool/ThreadPool.hpp"

TEST_CASE("Comparison runs every model independently", "[compare]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    transport.respond("http://localhost:8001/predict", 200,
                      R"({"predicted_winner":"Home Win","prob_home_win":0.55,"model_alias":"Quick Pick"})");
    transport.respond("http://localhost:8006/predict", 200,
                      R"({"predicted_winner":"Away","prob_away_rl":0.62,"model_alias":"Edge Finder"})");
    transport.respond("http://localhost:8003/predict", 500, R"({"detail":"model not loaded"})");

    PredictionOrchestrator orchestrator(registry, transport);
    ThreadPool pool(3);
    ModelComparison comparison(orchestrator, pool);

    PredictionRequest req{"Parramatta Eels", "Canterbury Bulldogs", "2024-07-05", std::nullopt, std::nullopt};
    auto outcomes = comparison.compare(req, {"Quick Pick", "Stacked", "Edge Finder", "Nonexistent"},
                                       std::nullopt);

    REQUIRE(outcomes.size() == 4);
    REQUIRE(outcomes[0].alias == "Quick Pick");
    REQUIRE(outcomes[0].result->confidence == Approx(0.55));
    REQUIRE_FALSE(outcomes[1].result.has_value());
    REQUIRE(outcomes[1].error.find("500") != std::string::npos);
    REQUIRE(outcomes[2].result->predictedWinner == "Away");
    REQUIRE_FALSE(outcomes[3].result.has_value());
    REQUIRE(outcomes[3].error.find("Nonexistent") != std::string::npos);

    // The unknown alias never reached the network.
    REQUIRE(transport.callCount() == 3);
}

TEST_CASE("Comparison honours cancellation", "[compare][cancel]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);
    ThreadPool pool(2);
    ModelComparison comparison(orchestrator, pool);

    CancellationToken token;
    token.cancel();
    PredictionRequest req{"A", "B", "2024-07-05", std::nullopt, std::nullopt};
    REQUIRE_THROWS_AS(comparison.compare(req, {"Quick Pick", "Stacked"}, std::nullopt, &token),
                      OperationCancelled);
}

TEST_CASE("Comparison records non-client errors and waits for every task", "[compare]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    transport.respond("http://localhost:8002/predict", 200,
                      R"({"predicted_winner":"Home Win","prob_home_win":0.58})");
    transport.respond("http://localhost:8003/predict", 200,
                      R"({"predicted_winner":"Away Win","prob_away_win":0.52})");
    transport.respond("http://localhost:8006/predict", 200,
                      R"({"predicted_winner":"Home","prob_home_rl":0.61})");

    std::atomic<int> finished{0};
    transport.onSend([&finished](const HttpRequest& req) {
        if (req.url == "http://localhost:8001/predict") {
            throw std::runtime_error("socket exploded");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ++finished;
    });

    PredictionOrchestrator orchestrator(registry, transport);
    ThreadPool pool(1);
    ModelComparison comparison(orchestrator, pool);

    PredictionRequest req{"Brisbane Broncos", "Canberra Raiders", "2024-08-10", std::nullopt, std::nullopt};
    auto outcomes = comparison.compare(req, {"Quick Pick", "Form Cruncher", "Stacked", "Edge Finder"},
                                       std::nullopt);

    REQUIRE(finished.load() == 3);
    REQUIRE(outcomes.size() == 4);
    REQUIRE_FALSE(outcomes[0].result.has_value());
    REQUIRE(outcomes[0].error == "socket exploded");
    REQUIRE(outcomes[1].result->confidence == Approx(0.58));
    REQUIRE(outcomes[2].result->confidence == Approx(0.52));
    REQUIRE(outcomes[3].result->confidence == Approx(0.61));
}

TEST_CASE("Comparison drains every task when requests cannot be serialized", "[compare]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);
    ThreadPool pool(1);

    std::vector<std::string> aliases(200, "Quick Pick");
    PredictionRequest req{"Bad \xff", "B", "2024-08-10", std::nullopt, std::nullopt};

    std::vector<ComparisonOutcome> outcomes;
    {
        auto comparison = std::make_unique<ModelComparison>(orchestrator, pool);
        outcomes = comparison->compare(req, aliases, std::nullopt);
    }

    REQUIRE(outcomes.size() == aliases.size());
    for (const auto& o : outcomes) {
        REQUIRE_FALSE(o.result.has_value());
        REQUIRE(o.error.find("UTF-8") != std::string::npos);
    }
    REQUIRE(transport.callCount() == 0);
}

TEST_CASE("ThreadPool delivers results and exceptions through futures", "[threadpool]") {
    ThreadPool pool(2);
    REQUIRE(pool.getWorkerCount() == 2);

    auto ok = pool.submit([]() { return 21 * 2; });
    auto bad = pool.submit([]() -> int { throw std::runtime_error("boom"); });

    REQUIRE(ok.get() == 42);
    REQUIRE_THROWS_AS(bad.get(), std::runtime_error);

    REQUIRE_THROWS_AS(ThreadPool(0), std::runtime_error);
}
