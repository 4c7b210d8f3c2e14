#include "api/ChatClient.hpp"
#include "api/FeedbackClient.hpp"
#include "api/HistoryReconciler.hpp"
#include "api/ModelComparison.hpp"
#include "api/PredictionOrchestrator.hpp"
#include "api/PurchaseStatusClient.hpp"
#include "api/RedemptionClient.hpp"
#include "core/Errors.hpp"
#include "core/ModelRegistry.hpp"
#include "entitlement/EntitlementGate.hpp"
#include "entitlement/EntitlementPoller.hpp"
#include "monitor/Logger.hpp"
#include "net/CancellationToken.hpp"
#include "net/CurlTransport.hpp"
#include "threadpool/ThreadPool.hpp"
#include "utils/Config.hpp"
#include "utils/Timestamp.hpp"

#include <signal.h>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>

static CancellationToken g_cancel;

static void onInterrupt(int) {
    g_cancel.cancel();
}

using Options = std::map<std::string, std::string>;

static void usage() {
    std::cout <<
        "usage: nrl_predict <command> [--config=path] [--uid=id] [--token=bearer] [options]\n"
        "  models                                     list models and entitlement state\n"
        "  predict  --home=T --away=T [--date=YYYY-MM-DD] [--model=alias]\n"
        "           [--odds-home=X] [--odds-away=X]\n"
        "  compare  --home=T --away=T [--date=...] [--models=a,b,...]\n"
        "  history                                    saved predictions, newest first\n"
        "  rate     --id=N --rating=1..5\n"
        "  result   --id=N --winner=T --margin=N\n"
        "  redeem   --coupon=CODE | --session=ID --code=CODE\n"
        "  status   [--session=ID]                    premium access state\n"
        "  chat     --message=TEXT --home=T --away=T [--date=YYYY-MM-DD]\n"
        "  entitlements [--watch=seconds]\n";
}

static std::string opt(const Options& o, const std::string& key, const std::string& def = "") {
    auto it = o.find(key);
    return it == o.end() ? def : it->second;
}

static std::optional<double> optNumber(const Options& o, const std::string& key) {
    auto it = o.find(key);
    if (it == o.end() || it->second.empty()) return std::nullopt;
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + " expects a number, got '" + it->second + "'");
    }
}

static std::string require(const Options& o, const std::string& key) {
    std::string v = opt(o, key);
    if (v.empty()) throw std::invalid_argument("missing --" + key);
    return v;
}

static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static void printResult(const CanonicalPredictionResult& r) {
    std::cout << r.modelAlias << " predicts: " << r.predictedWinner
              << " (Confidence: " << std::fixed << std::setprecision(1) << r.confidence * 100.0 << "%)";
    if (r.margin) std::cout << " | Margin: " << r.margin->dump();
    if (r.predictionId) std::cout << " | id " << *r.predictionId;
    std::cout << std::defaultfloat << "\n";
}

static void printStatus(const PurchaseStatus& s) {
    if (s.hasAccess) {
        std::cout << "You have premium access\n"
                  << "  Tier: " << s.tier.value_or("?") << "\n"
                  << "  Expires at: " << s.expiresAt.value_or("?") << "\n";
    } else {
        std::cout << "No premium access. Redeem a coupon or one-time code with 'nrl_predict redeem'.\n";
    }
}

static PredictionRequest requestFrom(const Options& o) {
    PredictionRequest req;
    req.teamA = require(o, "home");
    req.teamB = require(o, "away");
    req.matchDateISO = opt(o, "date", nowIso8601().substr(0, 10));
    if (req.teamA == req.teamB) throw std::invalid_argument("home and away teams must differ");
    if (!parseIsoTimestampMs(req.matchDateISO)) {
        throw std::invalid_argument("--date expects YYYY-MM-DD, got '" + req.matchDateISO + "'");
    }
    req.oddsHome = optNumber(o, "odds-home");
    req.oddsAway = optNumber(o, "odds-away");
    return req;
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, onInterrupt);

    if (argc < 2) {
        usage();
        return 2;
    }

    std::string command = argv[1];
    Options o;

    // --key=value
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            std::cerr << "[MAIN] Unexpected argument: " << arg << "\n";
            return 2;
        }
        auto eq = arg.find('=');
        if (eq == std::string::npos) o[arg.substr(2)] = "";
        else o[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
    }

    Config cfg(opt(o, "config", "config/client.json"));

    CurlGlobal curlGlobal;
    CurlTransport transport(cfg.timeout_ms);
    Logger callLog(cfg.call_log);
    ModelRegistry registry(cfg.model_host);

    Identity identity;
    identity.uid = opt(o, "uid");
    if (!opt(o, "token").empty()) identity.credential = opt(o, "token");

    EntitlementGate gate(registry, transport, cfg.billing_service_url, &callLog);
    EntitlementPoller poller(gate, std::chrono::seconds(cfg.entitlement_poll_seconds));

    PredictionOrchestrator orchestrator(registry, transport, &callLog);
    HistoryReconciler history(transport, cfg.user_service_url, &callLog);
    FeedbackClient feedback(transport, cfg.user_service_url, &callLog);
    RedemptionClient redemption(transport, cfg.user_service_url, cfg.purchase_service_url,
                                &poller, &callLog);
    PurchaseStatusClient purchaseStatus(transport, cfg.purchase_service_url, &callLog);
    ChatClient chat(transport, cfg.chat_service_url, &callLog);

    try {
        if (command == "models") {
            gate.refresh(identity, &g_cancel);
            for (const auto& c : gate.modelChoices()) {
                std::cout << std::left << std::setw(15) << c.model->alias
                          << (c.premium ? "[premium] " : "          ")
                          << (c.allowed ? "          " : "[locked]  ")
                          << c.model->description << "\n";
            }
            if (gate.canRedeem()) {
                std::cout << "Upgrade to Premium or redeem a coupon to unlock locked models.\n";
            }

        } else if (command == "predict") {
            PredictionRequest req = requestFrom(o);
            std::string alias = opt(o, "model", DEFAULT_MODEL_ALIAS);

            gate.refresh(identity, &g_cancel);
            if (registry.findByAlias(alias) && !gate.isEntitled(alias)) {
                std::cerr << "Upgrade required: Upgrade to Premium to access the " << alias
                          << " model, or redeem a coupon with 'nrl_predict redeem'.\n";
                return 3;
            }

            printResult(orchestrator.predict(req, alias, identity.credential, &g_cancel));

        } else if (command == "compare") {
            PredictionRequest req = requestFrom(o);
            gate.refresh(identity, &g_cancel);

            std::vector<std::string> aliases = splitList(opt(o, "models"));
            if (aliases.empty()) {
                for (const auto& c : gate.modelChoices()) {
                    if (c.allowed) aliases.push_back(c.model->alias);
                }
            }
            for (const auto& a : aliases) {
                if (registry.findByAlias(a) && !gate.isEntitled(a)) {
                    std::cerr << "Upgrade required for model " << a << "\n";
                    return 3;
                }
            }

            ThreadPool pool(cfg.worker_threads);
            ModelComparison comparison(orchestrator, pool);
            for (const auto& outcome : comparison.compare(req, aliases, identity.credential, &g_cancel)) {
                if (outcome.result) printResult(*outcome.result);
                else std::cout << outcome.alias << ": failed (" << outcome.error << ")\n";
            }

        } else if (command == "history") {
            for (const auto& r : history.fetchHistory(require(o, "token"), &g_cancel)) {
                std::cout << (r.predictionTimestamp ? *r.predictionTimestamp : "N/A") << "  "
                          << r.homeTeamName.value_or("?") << " vs " << r.awayTeamName.value_or("?")
                          << "  ";
                printResult(r);
                if (r.actualWinner) {
                    std::cout << "    Result: " << *r.actualWinner << " by " << r.actualMargin.value_or(0) << "\n";
                }
                if (r.userRating) std::cout << "    Your rating: " << *r.userRating << "\n";
            }

        } else if (command == "rate") {
            std::int64_t id = std::stoll(require(o, "id"));
            int rating = std::stoi(require(o, "rating"));
            feedback.submitRating(id, rating, require(o, "token"), &g_cancel);
            std::cout << "Thanks for your feedback!\n";

        } else if (command == "result") {
            std::int64_t id = std::stoll(require(o, "id"));
            std::optional<double> margin = optNumber(o, "margin");
            feedback.submitActualResult(id, require(o, "winner"), margin.value_or(0.0),
                                        require(o, "token"), &g_cancel);
            std::cout << "Result saved.\n";

        } else if (command == "redeem") {
            if (!opt(o, "coupon").empty()) {
                redemption.redeemCoupon(identity.uid, opt(o, "coupon"), &g_cancel);
                std::cout << "Coupon redeemed! You now have Premium access.\n";
            } else {
                redemption.redeemOneTimeCode(require(o, "session"), require(o, "code"), &g_cancel);
                std::cout << "One-time code redeemed! Access granted.\n";
            }
            printStatus(purchaseStatus.fetchStatus(identity.uid, opt(o, "session"), &g_cancel));

        } else if (command == "status") {
            printStatus(purchaseStatus.fetchStatus(identity.uid, opt(o, "session"), &g_cancel));

        } else if (command == "chat") {
            ChatQuestion q;
            q.userInput = require(o, "message");
            q.teamA = require(o, "home");
            q.teamB = require(o, "away");
            q.matchDate = opt(o, "date", nowIso8601().substr(0, 10));
            std::cout << chat.ask(q, identity.credential, &g_cancel) << "\n";

        } else if (command == "entitlements") {
            int watch = std::stoi(opt(o, "watch", "0"));
            poller.start(identity);

            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(watch);
            std::uint64_t seen = 0;
            do {
                if (!poller.waitForRefreshes(seen + 1, std::chrono::milliseconds(cfg.timeout_ms + 500))) continue;
                seen = poller.completedRefreshes();
                std::cout << "Entitlements:";
                for (const auto& a : *gate.currentEntitlements()) std::cout << " [" << a << "]";
                std::cout << "\n";
            } while (!g_cancel.isCancelled() && std::chrono::steady_clock::now() < deadline);

            poller.stop();

        } else {
            usage();
            return 2;
        }
    } catch (const OperationCancelled&) {
        std::cerr << "Cancelled.\n";
        return 130;
    } catch (const UnknownModel& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const TransportError& e) {
        std::cerr << "Request failed: " << e.what() << "\nPlease try again.\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        usage();
        return 2;
    } catch (const std::out_of_range& e) {
        std::cerr << "Invalid input: number out of range (" << e.what() << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
