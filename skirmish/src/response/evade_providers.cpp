// evade_providers.cpp
#include "evade_providers.h"

#include "abilities/ability.h"
#include "abilities/response_abilities.h"
#include "resolution/resolution_context.h"
#include "resolution/resolution_stack.h"
#include "rules/game.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

void pushDefenderWindow(ResolutionContext& context, const EvadeRequest& request) {
    context.stack->push(evadeWindow(context, request.defender, request.response_type, request.source_event,
                                    request.required_count),
                        context);
}

}  // namespace

bool AssistanceEvadeProvider::tryProvide(ResolutionContext& context, EvadeRequest& request) {
    auto* ability = findActiveAbility<ResponseAssistanceAbility>(context.abilities, *context.game, *request.defender);
    if (ability == nullptr || !ability->canProvideAssistance(*context.game, *request.defender, request.response_type)) {
        return false;
    }
    std::vector<Player*> helpers = ability->assistants(*context.game, *request.defender);
    if (helpers.empty()) {
        return false;
    }
    if (!context.confirm(request.defender->seat, "assistance.request")) {
        return false;
    }

    context.stack->push(std::make_unique<AssistanceResolver>(context.requireSession("assistance").get(kEvadeRequest),
                                                             helpers),
                        context);
    request.high_priority_activated = true;
    context.log("AssistanceRequested", std::format("{} asks for assistance", request.defender->toString()));
    return false;
}

bool EnhancementEvadeProvider::tryProvide(ResolutionContext& context, EvadeRequest& request) {
    auto* ability = findActiveAbility<ResponseEnhancementAbility>(context.abilities, *context.game, *request.defender);
    if (ability == nullptr || context.judgement == nullptr ||
        !ability->canProvideResponse(*context.game, *request.defender, request)) {
        return false;
    }
    if (!context.confirm(request.defender->seat, "enhancement.activate")) {
        return false;
    }
    return ability->executeAlternativeResponse(context, *request.defender, request);
}

bool ManualEvadeProvider::tryProvide(ResolutionContext& context, EvadeRequest& request) {
    pushDefenderWindow(context, request);
    return false;
}

std::vector<std::unique_ptr<EvadeProvider>> standardEvadeProviders() {
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    providers.push_back(std::make_unique<AssistanceEvadeProvider>());
    providers.push_back(std::make_unique<EnhancementEvadeProvider>());
    providers.push_back(std::make_unique<ManualEvadeProvider>());
    return providers;
}

bool hasAlternativeEvadeSource(const ResolutionContext& context, const EvadeRequest& request) {
    const Game& game = *context.game;
    const Player& defender = *request.defender;
    auto* assistance = findActiveAbility<ResponseAssistanceAbility>(context.abilities, game, defender);
    if (assistance && assistance->canProvideAssistance(game, defender, request.response_type) &&
        !assistance->assistants(game, defender).empty()) {
        return true;
    }
    auto* enhancement = findActiveAbility<ResponseEnhancementAbility>(context.abilities, game, defender);
    return enhancement && context.judgement && enhancement->canProvideResponse(game, defender, request);
}

EvadeProviderChainResolver::EvadeProviderChainResolver(std::shared_ptr<EvadeRequest> request,
                                                       std::vector<std::unique_ptr<EvadeProvider>> providers)
    : request(std::move(request)), providers(std::move(providers)) {
    if (!this->request || this->request->defender == nullptr) {
        throw std::invalid_argument("Provider chain needs a request with a defender");
    }
    for (const std::unique_ptr<EvadeProvider>& provider : this->providers) {
        if (!provider) {
            throw std::invalid_argument("Provider chain contains a null provider");
        }
    }
}

ResolutionResult EvadeProviderChainResolver::resolve(ResolutionContext& context) {
    ResolutionSession& session = context.requireSession(kind());
    session.set(kEvadeRequest, request);
    session.set(kLastResponseResult, ResponseWindowResult{});
    tried_providers.clear();

    std::stable_sort(providers.begin(), providers.end(),
                     [](const std::unique_ptr<EvadeProvider>& a, const std::unique_ptr<EvadeProvider>& b) {
                         return a->priority() < b->priority();
                     });

    for (const std::unique_ptr<EvadeProvider>& provider : providers) {
        if (request->resolved || request->high_priority_activated) {
            break;
        }
        tried_providers.push_back(provider->name());
        bool provided = provider->tryProvide(context, *request);
        spdlog::debug("Evade provider {} for {}: {}", provider->name(), request->defender->toString(),
                      provided ? "resolved" : "not resolved");

        if (provided && request->resolved) {
            session.set(kLastResponseResult,
                        ResponseWindowResult{ResponseWindowState::RESPONSE_SUCCESS, request->provided_by,
                                             request->provided_card, request->required_count});
            context.log("EvadeProvided", std::format("{} evades through {}", request->defender->toString(),
                                                     provider->name()));
            break;
        }
    }
    return ResolutionResult::ok();
}

AssistanceResolver::AssistanceResolver(std::shared_ptr<EvadeRequest> request, std::vector<Player*> helpers)
    : request(std::move(request)), helpers(std::move(helpers)) {}

ResolutionResult AssistanceResolver::resolve(ResolutionContext& context) {
    context.requireSession(kind());
    for (Player* helper : helpers) {
        if (helper == nullptr || !helper->alive || helper == request->defender) {
            continue;
        }
        if (!context.confirm(helper->seat, "assistance.offer")) {
            continue;
        }
        context.log("AssistanceOffered", std::format("{} answers for {}", helper->toString(),
                                                     request->defender->toString()));
        context.stack->push(std::make_unique<AssistanceOutcomeResolver>(request, helper), context);
        context.stack->push(evadeWindow(context, helper, request->response_type, request->source_event,
                                        request->required_count),
                            context);
        return ResolutionResult::ok();
    }
    pushDefenderWindow(context, *request);
    return ResolutionResult::ok();
}

AssistanceOutcomeResolver::AssistanceOutcomeResolver(std::shared_ptr<EvadeRequest> request, Player* helper)
    : request(std::move(request)), helper(helper) {}

ResolutionResult AssistanceOutcomeResolver::resolve(ResolutionContext& context) {
    ResolutionSession& session = context.requireSession(kind());
    const ResponseWindowResult* result = session.find(kLastResponseResult);
    if (result && result->state == ResponseWindowState::RESPONSE_SUCCESS) {
        request->resolve(helper->seat, result->responded_card);
        return ResolutionResult::ok();
    }
    pushDefenderWindow(context, *request);
    return ResolutionResult::ok();
}
