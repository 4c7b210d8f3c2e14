#pragma once
#include <string>
#include <vector>

enum class ModelTier { Free, Premium };

struct ModelDescriptor {
    std::string id;
    std::string alias;
    std::string endpoint;
    ModelTier tier;
    std::string description;
    bool sendsBookmakerOdds;
};

// Alias every caller may use, and the only one left after a failed entitlement refresh.
extern const char* const DEFAULT_MODEL_ALIAS;

// Compiled-in model table. Endpoints are "<modelHost>:<port>/predict".
class ModelRegistry {
public:
    explicit ModelRegistry(const std::string& modelHost);

    // nullptr when the alias is unknown.
    const ModelDescriptor* findByAlias(const std::string& alias) const;

    const std::vector<ModelDescriptor>& all() const { return models_; }

private:
    std::vector<ModelDescriptor> models_;
};
