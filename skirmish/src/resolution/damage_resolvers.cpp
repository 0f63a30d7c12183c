// damage_resolvers.cpp
#include "damage_resolvers.h"

#include "resolution/resolution_context.h"
#include "resolution/resolution_stack.h"
#include "response/response_window.h"
#include "rules/game.h"

#include <format>

namespace {

void killPlayer(ResolutionContext& context, Player& player, std::optional<int> killer_seat) {
    player.alive = false;
    PlayerDiedEvent died;
    died.seat = player.seat;
    died.killer_seat = killer_seat;
    context.publish(died);
    context.log("PlayerDied", std::format("{} dies", player.toString()), spdlog::level::info,
                {{"seat", std::to_string(player.seat)}});
}

}  // namespace

ResolutionResult DamageResolver::resolve(ResolutionContext& context) {
    if (!context.pending_damage) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.damage.noPendingDamage");
    }

    BeforeDamageEvent before;
    before.damage = *context.pending_damage;
    before.damage.validate();
    context.publish(before);
    if (before.prevented && before.damage.preventable) {
        context.log("DamagePrevented", std::format("Damage to seat {} prevented by {}", before.damage.target_seat,
                                                   before.prevented_by));
        return ResolutionResult::ok();
    }

    DamageDescriptor damage = before.damage;
    damage.validate();
    Player* target = context.game->player(damage.effectiveTarget());
    if (target == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_TARGET, "resolution.damage.unknownTarget");
    }
    if (!target->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.damage.targetDead");
    }

    int previous = target->health;
    int current = target->takeDamage(damage.amount);

    DamageAppliedEvent applied;
    applied.damage = damage;
    applied.target_seat = target->seat;
    applied.previous_health = previous;
    applied.current_health = current;
    context.publish(applied);

    context.log("DamageApplied", std::format("{} takes {} {} damage", target->toString(), damage.amount,
                                             toString(damage.kind)),
                spdlog::level::info,
                {{"target", std::to_string(target->seat)},
                 {"amount", std::to_string(damage.amount)},
                 {"previous", std::to_string(previous)},
                 {"current", std::to_string(current)},
                 {"reason", damage.reason}});

    DamageResolvedEvent resolved;
    resolved.damage = damage;
    resolved.target_seat = target->seat;
    resolved.previous_health = previous;
    resolved.current_health = current;
    context.publish(resolved);

    if (target->alive && target->health <= 0) {
        if (damage.triggers_dying) {
            context.stack->push(std::make_unique<DyingResolver>(target->seat, damage.source_seat), context);
        } else {
            killPlayer(context, *target, damage.source_seat);
        }
    }
    return ResolutionResult::ok();
}

DyingResolver::DyingResolver(int seat, std::optional<int> source_seat) : seat(seat), source_seat(source_seat) {}

ResolutionResult DyingResolver::resolve(ResolutionContext& context) {
    Player* player = context.game->player(seat);
    if (player == nullptr || !player->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.dying.notAlive");
    }
    if (player->health > 0) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.dying.notDying");
    }

    DyingStartEvent start;
    start.seat = seat;
    start.source_seat = source_seat;
    context.publish(start);
    context.log("DyingStart", std::format("{} is dying", player->toString()));

    if (!context.canAskPlayers()) {
        killPlayer(context, *player, source_seat);
        return ResolutionResult::ok();
    }
    context.ensureSession();
    context.stack->push(std::make_unique<DyingRescueResolver>(seat, source_seat), context);
    context.stack->push(peachWindow(context, player, SourceEvent{"dying", source_seat, seat, nullptr}), context);
    return ResolutionResult::ok();
}

DyingRescueResolver::DyingRescueResolver(int seat, std::optional<int> source_seat)
    : seat(seat), source_seat(source_seat) {}

ResolutionResult DyingRescueResolver::resolve(ResolutionContext& context) {
    ResolutionSession& session = context.requireSession(kind());
    Player* player = context.game->player(seat);
    if (player == nullptr || !player->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.dyingRescue.notAlive");
    }

    const ResponseWindowResult* result = session.find(kLastResponseResult);
    if (result && result->state == ResponseWindowState::RESPONSE_SUCCESS) {
        int current = player->heal(1);
        HealedEvent healed;
        healed.seat = seat;
        healed.amount = 1;
        healed.current_health = current;
        context.publish(healed);
        context.log("DyingRescued", std::format("{} is rescued by seat {}", player->toString(),
                                                result->responder_seat.value_or(-1)));
        if (player->health <= 0) {
            context.stack->push(std::make_unique<DyingResolver>(seat, source_seat), context);
        }
        return ResolutionResult::ok();
    }

    killPlayer(context, *player, source_seat);
    return ResolutionResult::ok();
}
