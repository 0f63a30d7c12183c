// equipment_abilities.cpp
#include "equipment_abilities.h"

#include "judgement/judgement_service.h"
#include "resolution/resolution_context.h"
#include "response/evade_request.h"
#include "rules/card.h"
#include "rules/player.h"

#include <climits>
#include <format>
#include <stdexcept>
#include <utility>

RuleHookSet ZhugeCrossbowAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::MAX_USES_PER_TURN});
}

std::optional<int> ZhugeCrossbowAbility::modifyMaxUsesPerTurn(int,
                                                              const Game&,
                                                              const Player& user,
                                                              CardSubType subtype) const {
    if (&user != owner() || subtype != CardSubType::ATTACK) {
        return std::nullopt;
    }
    return INT_MAX;
}

WeaponRangeAbility::WeaponRangeAbility(std::string ability_id, int range)
    : ability_id(std::move(ability_id)), range(range) {
    if (range < 1) {
        throw std::invalid_argument(std::format("Weapon {} needs a positive range", this->ability_id));
    }
}

RuleHookSet WeaponRangeAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::ATTACK_DISTANCE});
}

std::optional<int> WeaponRangeAbility::modifyAttackDistance(int, const Game&, const Player& from, const Player&) const {
    if (&from != owner()) {
        return std::nullopt;
    }
    return range;
}

RuleHookSet DefensiveHorseAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::SEAT_DISTANCE});
}

std::optional<int> DefensiveHorseAbility::modifySeatDistance(int, const Game&, const Player&, const Player& to) const {
    if (&to != owner()) {
        return std::nullopt;
    }
    return 1;
}

RuleHookSet OffensiveHorseAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::SEAT_DISTANCE});
}

std::optional<int> OffensiveHorseAbility::modifySeatDistance(int, const Game&, const Player& from, const Player&) const {
    if (&from != owner()) {
        return std::nullopt;
    }
    return -1;
}

void RenwangShieldAbility::subscribe(EventBus& event_bus) {
    listen<CardEffectCheckEvent>(event_bus, [this](CardEffectCheckEvent& event) {
        Player* self = owner();
        if (self == nullptr || event.vetoed || event.target_seat != self->seat || event.card == nullptr) {
            return;
        }
        if (event.card->subtype == CardSubType::ATTACK && event.card->isBlack()) {
            event.vetoed = true;
            event.vetoed_by = id();
        }
    });
}

bool BaguaArrayAbility::canProvideResponse(const Game&, const Player& owner, const EvadeRequest& request) const {
    return request.response_type == ResponseType::ATTACK_EVADE && request.defender == &owner &&
           request.required_count == 1 && !request.resolved;
}

bool BaguaArrayAbility::executeAlternativeResponse(ResolutionContext& context, Player& owner, EvadeRequest& request) {
    if (context.judgement == nullptr) {
        throw std::logic_error("bagua_array needs a judgement service");
    }
    JudgementResult judgement =
        context.judgement->judge(*context.game, owner, JudgementRequest{id(), judgement_rules::isRed()});
    if (!judgement.success) {
        context.log("AbilityFizzled", std::format("bagua_array judgement for {} is not red", owner.toString()));
        return false;
    }
    request.resolve(owner.seat, nullptr);
    context.log("AbilityActivated", std::format("{} evades with bagua_array", owner.toString()));
    return true;
}
