#include "entitlement/EntitlementGate.hpp"

#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

EntitlementGate::EntitlementGate(const ModelRegistry& registry, HttpTransport& transport,
                                 std::string billingServiceUrl, Logger* callLog)
    : registry_(registry),
      transport_(transport),
      billingServiceUrl_(std::move(billingServiceUrl)),
      callLog_(callLog),
      current_(std::make_shared<const EntitlementSet>()) {}

EntitlementSet EntitlementGate::defaultSet() {
    return EntitlementSet{DEFAULT_MODEL_ALIAS};
}

std::shared_ptr<const EntitlementSet> EntitlementGate::currentEntitlements() const {
    std::lock_guard<std::mutex> lock(stateMtx_);
    return current_;
}

Identity EntitlementGate::currentIdentity() const {
    std::lock_guard<std::mutex> lock(stateMtx_);
    return identity_;
}

void EntitlementGate::changeIdentity(const Identity& identity) {
    std::lock_guard<std::mutex> lock(stateMtx_);
    adoptIdentityLocked(identity);
}

std::uint64_t EntitlementGate::adoptIdentityLocked(const Identity& identity) {
    if (identity.uid == identity_.uid) {
        identity_.credential = identity.credential;
        return generation_;
    }

    LOGX("ENTITLE", "Identity changed ('" << identity_.uid << "' -> '" << identity.uid
                    << "'), discarding cached entitlements");
    identity_ = identity;
    current_ = std::make_shared<const EntitlementSet>();
    return ++generation_;
}

std::shared_ptr<const EntitlementSet>
EntitlementGate::publish(std::shared_ptr<const EntitlementSet> next, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (generation != generation_) {
        LOGX("ENTITLE", "Identity changed during refresh, result dropped");
        return current_;
    }
    current_ = std::move(next);
    return current_;
}

// nullptr when the body is not {"entitlements": [...]}.
std::shared_ptr<const EntitlementSet> EntitlementGate::parseEntitlements(const std::string& body) const {
    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return nullptr;

    auto it = j.find("entitlements");
    if (it == j.end() || !it->is_array()) return nullptr;

    EntitlementSet set = defaultSet();
    for (const auto& item : *it) {
        if (!item.is_string()) {
            LOGW("ENTITLE", "Ignoring non-string entitlement " << item.dump());
            continue;
        }
        std::string alias = item.get<std::string>();
        if (!registry_.findByAlias(alias)) {
            LOGW("ENTITLE", "Ignoring unknown entitlement '" << alias << "'");
            continue;
        }
        set.insert(alias);
    }
    return std::make_shared<const EntitlementSet>(std::move(set));
}

std::shared_ptr<const EntitlementSet>
EntitlementGate::fetch(const Identity& identity, const CancellationToken* cancel) {
    std::string url = billingServiceUrl_ + "/entitlements";
    if (!identity.uid.empty()) url += "?uid=" + urlEncode(identity.uid);

    CallTimer timer;
    LogEntry entry = beginEntry("entitlements", "", url);

    HttpRequest req = jsonRequest(HttpMethod::Get, url, identity.credential);

    std::shared_ptr<const EntitlementSet> set;
    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        if (res.statusCode == 403) {
            LOGW("ENTITLE", "Not authorized for premium modes (403)");
        }
        ensureSuccess(res, "Fetch entitlements");

        set = parseEntitlements(res.body);
        if (!set) {
            entry.outcome = "malformed";
            LOGW("ENTITLE", toString(NoteKind::MalformedResponse)
                            << ": expected {\"entitlements\": [...]}");
        }
    } catch (const ClientError&) {
        recordFailure(callLog_, entry, timer);
        throw;
    }
    recordCall(callLog_, entry, timer);
    return set;
}

std::shared_ptr<const EntitlementSet> EntitlementGate::refresh(const Identity& identity,
                                                               const CancellationToken* cancel) {
    return refreshImpl(&identity, cancel);
}

std::shared_ptr<const EntitlementSet> EntitlementGate::refreshCurrent(const CancellationToken* cancel) {
    return refreshImpl(nullptr, cancel);
}

std::shared_ptr<const EntitlementSet> EntitlementGate::refreshImpl(const Identity* requested,
                                                                   const CancellationToken* cancel) {
    std::lock_guard<std::mutex> writer(refreshMtx_);

    Identity identity;
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(stateMtx_);
        generation = requested ? adoptIdentityLocked(*requested) : generation_;
        identity = identity_;
    }

    std::shared_ptr<const EntitlementSet> next;
    try {
        next = fetch(identity, cancel);
    } catch (const OperationCancelled&) {
        LOGX("ENTITLE", "Refresh cancelled, keeping current entitlements");
        return currentEntitlements();
    } catch (const ClientError& e) {
        LOGW("ENTITLE", "Refresh failed, falling back to default entitlements: " << e.what());
    }

    if (!next) {
        next = std::make_shared<const EntitlementSet>(defaultSet());
    }

    std::shared_ptr<const EntitlementSet> published = publish(std::move(next), generation);
    LOGX("ENTITLE", "Entitlements for '" << identity.uid << "': " << published->size() << " model(s)");
    return published;
}

bool EntitlementGate::isEntitled(const std::string& alias) const {
    std::shared_ptr<const EntitlementSet> set = currentEntitlements();
    return set->count(alias) > 0;
}

std::vector<ModelChoice> EntitlementGate::modelChoices() const {
    std::shared_ptr<const EntitlementSet> set = currentEntitlements();

    std::vector<ModelChoice> choices;
    for (const auto& m : registry_.all()) {
        choices.push_back(ModelChoice{&m, set->count(m.alias) > 0, m.tier == ModelTier::Premium});
    }
    return choices;
}

bool EntitlementGate::canRedeem() const {
    for (const auto& c : modelChoices()) {
        if (c.premium && !c.allowed) return true;
    }
    return false;
}
