// draw_phase_resolver.cpp
#include "draw_phase_resolver.h"

#include "resolution/resolution_context.h"
#include "rules/game.h"
#include "rules/rule_service.h"
#include "zones/card_move_service.h"

#include <format>

ResolutionResult DrawPhaseResolver::resolve(ResolutionContext& context) {
    Player* player = context.source_player;
    if (player == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.drawPhase.noPlayer");
    }
    if (!player->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.drawPhase.playerDead");
    }
    int count = context.rules->drawCount(*context.game, *player);
    std::vector<Card*> drawn = context.card_moves->drawCards(*player, count);
    context.log("CardsDrawn", std::format("{} draws {} cards", player->toString(), drawn.size()), spdlog::level::info,
                {{"seat", std::to_string(player->seat)}, {"count", std::to_string(count)}});
    return ResolutionResult::ok();
}
