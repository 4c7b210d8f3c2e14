#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/ModelRegistry.hpp"

class HttpTransport;
class CancellationToken;
class Logger;

using EntitlementSet = std::set<std::string>;

// Who the entitlements belong to. An empty uid is the anonymous caller.
struct Identity {
    std::string uid;
    std::optional<std::string> credential;
};

struct ModelChoice {
    const ModelDescriptor* model;
    bool allowed;
    bool premium;
};

// Cached view of the aliases the current identity may use.
//
// The set is immutable and published by swapping a shared_ptr under a short
// lock, so readers always see either the previous or the next complete set and
// never wait for a refresh in flight. Refreshes are serialized. A refresh that
// finishes after the identity changed is dropped. Any failure (network, non-2xx,
// 403, malformed body) publishes the default set: fail closed.
class EntitlementGate {
public:
    EntitlementGate(const ModelRegistry& registry, HttpTransport& transport,
                    std::string billingServiceUrl, Logger* callLog = nullptr);

    std::shared_ptr<const EntitlementSet> currentEntitlements() const;

    // Fetches, validates and publishes the set for `identity`, returning what is
    // current afterwards. A different uid than the current one is an identity
    // change (see changeIdentity). Never throws; a cancelled fetch leaves the
    // current set untouched.
    std::shared_ptr<const EntitlementSet> refresh(const Identity& identity,
                                                  const CancellationToken* cancel = nullptr);

    // Refreshes for whatever identity is current when the fetch starts.
    std::shared_ptr<const EntitlementSet> refreshCurrent(const CancellationToken* cancel = nullptr);

    // Discards the cached set (back to empty) and invalidates refreshes in flight.
    // Same uid with a new credential only updates the credential.
    void changeIdentity(const Identity& identity);

    Identity currentIdentity() const;

    bool isEntitled(const std::string& alias) const;

    // Every registry model, in registry order, flagged for the presentation layer.
    std::vector<ModelChoice> modelChoices() const;

    // Redemption (coupon / one-time code) is offered while some premium model is locked.
    bool canRedeem() const;

    // { DEFAULT_MODEL_ALIAS }
    static EntitlementSet defaultSet();

private:
    // Requires stateMtx_. Returns the generation the caller's fetch belongs to.
    std::uint64_t adoptIdentityLocked(const Identity& identity);

    // requested == nullptr: use the current identity.
    std::shared_ptr<const EntitlementSet> refreshImpl(const Identity* requested,
                                                      const CancellationToken* cancel);

    std::shared_ptr<const EntitlementSet> fetch(const Identity& identity,
                                                const CancellationToken* cancel);
    std::shared_ptr<const EntitlementSet> parseEntitlements(const std::string& body) const;

    // Publishes `next` unless the identity changed since `generation` was read.
    std::shared_ptr<const EntitlementSet> publish(std::shared_ptr<const EntitlementSet> next,
                                                  std::uint64_t generation);

    const ModelRegistry& registry_;
    HttpTransport& transport_;
    std::string billingServiceUrl_;
    Logger* callLog_;

    mutable std::mutex stateMtx_;          // current_, identity_, generation_
    std::shared_ptr<const EntitlementSet> current_;
    Identity identity_;
    std::uint64_t generation_ = 0;

    std::mutex refreshMtx_;                // one refresh at a time
};
