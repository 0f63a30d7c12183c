#pragma once

#include <memory>
#include <string>
#include <vector>

#include "resolution/resolver.h"
#include "response/evade_request.h"

class ResolutionContext;

// One way of satisfying an EvadeRequest. Lower priority values are tried first.
class EvadeProvider {
public:
    virtual ~EvadeProvider() = default;
    virtual int priority() const = 0;
    virtual std::string name() const = 0;
    // Returns true when the request was resolved synchronously. Deferring providers push
    // resolvers and return false.
    virtual bool tryProvide(ResolutionContext& context, EvadeRequest& request) = 0;
};

class AssistanceEvadeProvider : public EvadeProvider {
public:
    int priority() const override { return 0; }
    std::string name() const override { return "assistance"; }
    bool tryProvide(ResolutionContext& context, EvadeRequest& request) override;
};

class EnhancementEvadeProvider : public EvadeProvider {
public:
    int priority() const override { return 1; }
    std::string name() const override { return "enhancement"; }
    bool tryProvide(ResolutionContext& context, EvadeRequest& request) override;
};

class ManualEvadeProvider : public EvadeProvider {
public:
    int priority() const override { return 2; }
    std::string name() const override { return "manual"; }
    bool tryProvide(ResolutionContext& context, EvadeRequest& request) override;
};

std::vector<std::unique_ptr<EvadeProvider>> standardEvadeProviders();

// True when the defender has an ability able to take part in a provider chain.
bool hasAlternativeEvadeSource(const ResolutionContext& context, const EvadeRequest& request);

// Tries each provider in ascending priority until the request is resolved or a provider
// activates and locks out the rest. Always succeeds; deferred providers finish the request
// through the resolvers they pushed. The chain must carry a session.
class EvadeProviderChainResolver : public Resolver {
public:
    EvadeProviderChainResolver(std::shared_ptr<EvadeRequest> request,
                               std::vector<std::unique_ptr<EvadeProvider>> providers);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "evade-provider-chain"; }

    // Names of the providers tried during the last resolve, in order.
    const std::vector<std::string>& tried() const { return tried_providers; }

private:
    std::shared_ptr<EvadeRequest> request;
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    std::vector<std::string> tried_providers;
};

// Asks the owner's helpers one by one; the first volunteer gets an evade window.
class AssistanceResolver : public Resolver {
public:
    AssistanceResolver(std::shared_ptr<EvadeRequest> request, std::vector<Player*> helpers);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "assistance"; }

private:
    std::shared_ptr<EvadeRequest> request;
    std::vector<Player*> helpers;
};

// Reads the helper's window. Success resolves the request; otherwise the defender answers alone.
class AssistanceOutcomeResolver : public Resolver {
public:
    AssistanceOutcomeResolver(std::shared_ptr<EvadeRequest> request, Player* helper);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "assistance-outcome"; }

private:
    std::shared_ptr<EvadeRequest> request;
    Player* helper;
};
