#include "core/ModelRegistry.hpp"

const char* const DEFAULT_MODEL_ALIAS = "Quick Pick";

namespace {

struct ModelSeed {
    const char* id;
    const char* alias;
    int port;
    ModelTier tier;
    const char* description;
    bool sendsBookmakerOdds;
};

// Display order.
const ModelSeed kModels[] = {
    {"lr",          "Quick Pick",    8001, ModelTier::Free,    "Fast baseline prediction.",           true},
    {"lgbm",        "Form Cruncher", 8002, ModelTier::Free,    "Balanced performance model.",         true},
    {"transformer", "Deep Dive",     8004, ModelTier::Premium, "Context-aware transformer model.",    false},
    {"stacker",     "Stacked",       8003, ModelTier::Premium, "Ensemble model for higher accuracy.", true},
    {"rl",          "Edge Finder",   8006, ModelTier::Premium, "Reinforcement learning agent.",       true},
};

} // namespace

ModelRegistry::ModelRegistry(const std::string& modelHost) {
    std::string host = modelHost;
    while (!host.empty() && host.back() == '/') host.pop_back();

    for (const auto& s : kModels) {
        models_.push_back(ModelDescriptor{
            s.id,
            s.alias,
            host + ":" + std::to_string(s.port) + "/predict",
            s.tier,
            s.description,
            s.sendsBookmakerOdds
        });
    }
}

const ModelDescriptor* ModelRegistry::findByAlias(const std::string& alias) const {
    for (const auto& m : models_) {
        if (m.alias == alias) return &m;
    }
    return nullptr;
}
