#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "FakeTransport.hpp"
#include "api/FeedbackClient.hpp"
#include "api/RedemptionClient.hpp"
#include "entitlement/EntitlementPoller.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("Rating submission", "[feedback]") {
    FakeTransport transport;
    FeedbackClient feedback(transport, "http://users.local");
    transport.respond("http://users.local/users/feedback/rating", 201, "");

    feedback.submitRating(42, 4, "tok");

    HttpRequest sent = transport.lastRequest();
    REQUIRE(sent.method == HttpMethod::Post);
    REQUIRE(sent.headers.at("Authorization") == "Bearer tok");
    json body = json::parse(sent.body);
    REQUIRE(body["prediction_id"].get<std::int64_t>() == 42);
    REQUIRE(body["rating_value"].get<int>() == 4);

    SECTION("Out-of-range rating is rejected locally") {
        REQUIRE_THROWS_AS(feedback.submitRating(42, 0, "tok"), std::invalid_argument);
        REQUIRE_THROWS_AS(feedback.submitRating(42, 6, "tok"), std::invalid_argument);
        REQUIRE(transport.callCount() == 1);
    }

    SECTION("Backend rejection surfaces the detail") {
        transport.respond("http://users.local/users/feedback/rating", 404, R"({"detail":"Prediction not found"})");
        try {
            feedback.submitRating(999, 3, "tok");
            FAIL("expected TransportError");
        } catch (const TransportError& e) {
            REQUIRE(e.status() == 404);
            REQUIRE(e.detail() == "Prediction not found");
        }
    }
}

TEST_CASE("Actual result submission", "[feedback]") {
    FakeTransport transport;
    FeedbackClient feedback(transport, "http://users.local");
    transport.respond("http://users.local/users/feedback/result", 200, "{}");

    feedback.submitActualResult(7, "Cronulla Sharks", 12, "tok");

    json body = json::parse(transport.lastRequest().body);
    REQUIRE(body["prediction_id"].get<std::int64_t>() == 7);
    REQUIRE(body["actual_winner"].get<std::string>() == "Cronulla Sharks");
    REQUIRE(body["actual_margin"].get<double>() == Approx(12.0));

    REQUIRE_THROWS_AS(feedback.submitActualResult(7, "", 12, "tok"), std::invalid_argument);
    REQUIRE_THROWS_AS(feedback.submitActualResult(7, "Cronulla Sharks", -1, "tok"), std::invalid_argument);
    REQUIRE_THROWS_AS(feedback.submitActualResult(7, "Storm\xc3", 4, "tok"), std::invalid_argument);
    REQUIRE(transport.callCount() == 1);
}

TEST_CASE("Coupon redemption unlocks models without waiting for the next poll", "[redeem]") {
    ModelRegistry registry("http://localhost");
    FakeTransport transport;
    transport.respond("http://billing.local/entitlements?uid=u1", 200, R"({"entitlements": []})");
    transport.respond("http://users.local/purchase/coupon", 200, R"({"status":"ok"})");

    EntitlementGate gate(registry, transport, "http://billing.local");
    EntitlementPoller poller(gate, 1h);
    RedemptionClient redemption(transport, "http://users.local", "http://purchase.local", &poller);

    poller.start(Identity{"u1", std::nullopt});
    REQUIRE(poller.waitForRefreshes(1, 5s));
    REQUIRE(gate.canRedeem());

    transport.respond("http://billing.local/entitlements?uid=u1", 200,
                      R"({"entitlements": ["Deep Dive", "Stacked", "Edge Finder", "Form Cruncher"]})");
    redemption.redeemCoupon("u1", "NRL2024");

    REQUIRE(poller.waitForRefreshes(2, 5s));
    REQUIRE(gate.isEntitled("Edge Finder"));
    REQUIRE_FALSE(gate.canRedeem());

    bool sawCoupon = false;
    for (const auto& req : transport.requests()) {
        if (req.url != "http://users.local/purchase/coupon") continue;
        sawCoupon = true;
        json body = json::parse(req.body);
        REQUIRE(body["firebase_uid"].get<std::string>() == "u1");
        REQUIRE(body["coupon_code"].get<std::string>() == "NRL2024");
    }
    REQUIRE(sawCoupon);

    poller.stop();
}

TEST_CASE("Redemption failures", "[redeem]") {
    FakeTransport transport;
    RedemptionClient redemption(transport, "http://users.local", "http://purchase.local");

    SECTION("Invalid coupon") {
        transport.respond("http://users.local/purchase/coupon", 400, R"({"detail":"Invalid coupon"})");
        try {
            redemption.redeemCoupon("u1", "BOGUS");
            FAIL("expected TransportError");
        } catch (const TransportError& e) {
            REQUIRE(e.detail() == "Invalid coupon");
        }
    }

    SECTION("Missing identity or code is rejected locally") {
        REQUIRE_THROWS_AS(redemption.redeemCoupon("", "NRL2024"), std::invalid_argument);
        REQUIRE_THROWS_AS(redemption.redeemCoupon("u1", ""), std::invalid_argument);
        REQUIRE_THROWS_AS(redemption.redeemOneTimeCode("", "X1"), std::invalid_argument);
        REQUIRE_THROWS_AS(redemption.redeemCoupon("u1", "NRL\xff"), std::invalid_argument);
        REQUIRE(transport.callCount() == 0);
    }

    SECTION("One-time code goes to the purchase service") {
        transport.respond("http://purchase.local/purchase/one-time", 200, "{}");
        redemption.redeemOneTimeCode("sess-9", "ONCE-1");
        json body = json::parse(transport.lastRequest().body);
        REQUIRE(body["session_id"].get<std::string>() == "sess-9");
        REQUIRE(body["one_time_code"].get<std::string>() == "ONCE-1");
    }
}
