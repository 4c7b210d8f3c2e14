#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "FakeTransport.hpp"
#include "api/PredictionOrchestrator.hpp"

using json = nlohmann::json;

namespace {

PredictionRequest sampleRequest() {
    PredictionRequest req;
    req.teamA = "Penrith Panthers";
    req.teamB = "Sydney Roosters";
    req.matchDateISO = "2024-06-14";
    req.oddsHome = 1.65;
    req.oddsAway = 2.30;
    return req;
}

} // namespace

TEST_CASE("Unknown alias fails before any network call", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);

    REQUIRE_THROWS_AS(orchestrator.predict(sampleRequest(), "Nonexistent"), UnknownModel);
    REQUIRE(transport.callCount() == 0);

    try {
        orchestrator.predict(sampleRequest(), "Nonexistent");
    } catch (const UnknownModel& e) {
        REQUIRE(e.alias() == "Nonexistent");
    }
}

TEST_CASE("Orchestrator posts the request and normalizes the answer", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);

    transport.respond("http://localhost:8001/predict", 200,
                      R"({"predicted_winner":"Home Win","prob_home_win":0.64,"prob_away_win":0.36,
                          "model_alias":"Quick Pick","margin":7,"prediction_id":501})");

    auto r = orchestrator.predict(sampleRequest(), "Quick Pick");
    REQUIRE(r.predictedWinner == "Home Win");
    REQUIRE(r.confidence == Approx(0.64));
    REQUIRE(r.modelAlias == "Quick Pick");
    REQUIRE(r.predictionId == 501);

    REQUIRE(transport.callCount() == 1);
    HttpRequest sent = transport.lastRequest();
    REQUIRE(sent.method == HttpMethod::Post);
    REQUIRE(sent.url == "http://localhost:8001/predict");
    REQUIRE(sent.headers.at("Content-Type") == "application/json");
    REQUIRE(sent.headers.count("Authorization") == 0);

    json body = json::parse(sent.body);
    REQUIRE(body["team_a"].get<std::string>() == "Penrith Panthers");
    REQUIRE(body["team_b"].get<std::string>() == "Sydney Roosters");
    REQUIRE(body["match_date_str"].get<std::string>() == "2024-06-14");
    REQUIRE(body["odd_a"].get<double>() == Approx(1.65));
    REQUIRE(body["odd_b"].get<double>() == Approx(2.30));
    REQUIRE(body["odds_home_win"].get<double>() == Approx(1.65));
}

TEST_CASE("Orchestrator attaches the bearer credential when given", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);
    transport.respond("http://localhost:8006/predict", 200,
                      R"({"predicted_winner":"Home","prob_home_rl":0.73,"model_alias":"Edge Finder"})");

    auto r = orchestrator.predict(sampleRequest(), "Edge Finder", std::string("id-token-123"));
    REQUIRE(r.confidence == Approx(0.73));
    REQUIRE(transport.lastRequest().headers.at("Authorization") == "Bearer id-token-123");

    SECTION("Empty credential is not sent") {
        orchestrator.predict(sampleRequest(), "Edge Finder", std::string(""));
        REQUIRE(transport.lastRequest().headers.count("Authorization") == 0);
    }
}

TEST_CASE("Request body depends on the model and the odds given", "[orchestrator]") {
    ModelRegistry registry("http://localhost");

    SECTION("Deep Dive never receives odd_a / odd_b") {
        json body = PredictionOrchestrator::buildRequestBody(sampleRequest(), *registry.findByAlias("Deep Dive"));
        REQUIRE_FALSE(body.contains("odd_a"));
        REQUIRE_FALSE(body.contains("odd_b"));
        REQUIRE(body["odds_home_win"].get<double>() == Approx(1.65));
        REQUIRE(body["odds_away_win"].get<double>() == Approx(2.30));
    }

    SECTION("Missing odds are sent as null") {
        PredictionRequest req = sampleRequest();
        req.oddsHome.reset();
        req.oddsAway.reset();
        json body = PredictionOrchestrator::buildRequestBody(req, *registry.findByAlias("Quick Pick"));
        REQUIRE_FALSE(body.contains("odd_a"));
        REQUIRE(body["odds_home_win"].is_null());
        REQUIRE(body["odds_away_win"].is_null());
    }
}

TEST_CASE("Transport failures surface as TransportError", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);

    SECTION("Non-2xx keeps status and detail") {
        transport.respond("http://localhost:8003/predict", 422, R"({"detail":"Unknown team 'Nowhere'"})");
        try {
            orchestrator.predict(sampleRequest(), "Stacked");
            FAIL("expected TransportError");
        } catch (const TransportError& e) {
            REQUIRE(e.status() == 422);
            REQUIRE(e.detail() == "Unknown team 'Nowhere'");
            REQUIRE_FALSE(e.isNetworkFailure());
        }
        REQUIRE(transport.callCount() == 1);
    }

    SECTION("Non-JSON error body has no detail") {
        transport.respond("http://localhost:8003/predict", 503, "Service Unavailable");
        try {
            orchestrator.predict(sampleRequest(), "Stacked");
            FAIL("expected TransportError");
        } catch (const TransportError& e) {
            REQUIRE(e.status() == 503);
            REQUIRE(e.detail().empty());
        }
    }

    SECTION("Network failure is status 0 and not retried") {
        transport.failNetwork("http://localhost:8003/predict");
        try {
            orchestrator.predict(sampleRequest(), "Stacked");
            FAIL("expected TransportError");
        } catch (const TransportError& e) {
            REQUIRE(e.isNetworkFailure());
        }
        REQUIRE(transport.callCount() == 1);
    }
}

TEST_CASE("Malformed success body degrades instead of failing", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);
    transport.respond("http://localhost:8002/predict", 200, "not json");

    CanonicalPredictionResult r;
    REQUIRE_NOTHROW(r = orchestrator.predict(sampleRequest(), "Form Cruncher"));
    REQUIRE(r.confidence == 0.0);
    REQUIRE(r.modelAlias == "Form Cruncher");
    REQUIRE(r.hasNote(NoteKind::MalformedResponse));
}

TEST_CASE("Cancelled prediction produces no result", "[orchestrator][cancel]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);
    transport.respond("http://localhost:8001/predict", 200, R"({"predicted_winner":"Home Win"})");

    CancellationToken token;
    transport.onSend([&token](const HttpRequest&) { token.cancel(); });

    REQUIRE_THROWS_AS(orchestrator.predict(sampleRequest(), "Quick Pick", std::nullopt, &token),
                      OperationCancelled);
}

TEST_CASE("Team names that are not UTF-8 are rejected before sending", "[orchestrator]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    PredictionOrchestrator orchestrator(registry, transport);

    PredictionRequest req = sampleRequest();
    req.teamA = "Penrith \xff";
    REQUIRE_THROWS_AS(orchestrator.predict(req, "Quick Pick"), std::invalid_argument);
    REQUIRE(transport.callCount() == 0);
}
