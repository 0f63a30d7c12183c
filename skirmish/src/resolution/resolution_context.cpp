// resolution_context.cpp
#include "resolution_context.h"

#include "rules/game.h"

#include <format>
#include <stdexcept>

ResolutionContext::ResolutionContext(Game* game,
                                     Player* source_player,
                                     ResolutionStack* stack,
                                     CardMoveService* card_moves,
                                     RuleService* rules)
    : game(game), source_player(source_player), stack(stack), card_moves(card_moves), rules(rules) {
    if (game == nullptr || stack == nullptr || card_moves == nullptr || rules == nullptr) {
        throw std::invalid_argument("ResolutionContext needs a game, a stack, a card move service and a rule service");
    }
}

ResolutionContext ResolutionContext::withSource(Player* player) const {
    ResolutionContext copy = *this;
    copy.source_player = player;
    return copy;
}

ResolutionContext ResolutionContext::withDamage(const DamageDescriptor& damage) const {
    damage.validate();
    ResolutionContext copy = *this;
    copy.pending_damage = damage;
    return copy;
}

ResolutionContext ResolutionContext::withoutAction() const {
    ResolutionContext copy = *this;
    copy.action.reset();
    copy.choice.reset();
    return copy;
}

ResolutionSession& ResolutionContext::requireSession(const std::string& resolver_kind) const {
    if (!session) {
        throw std::logic_error(std::format("Resolver {} requires a resolution session", resolver_kind));
    }
    return *session;
}

ResolutionSession& ResolutionContext::ensureSession() {
    if (!session) {
        session = std::make_shared<ResolutionSession>();
    }
    return *session;
}

bool ResolutionContext::canAskPlayers() const {
    return static_cast<bool>(get_player_choice);
}

ChoiceResult ResolutionContext::ask(const ChoiceRequest& request) const {
    if (!get_player_choice) {
        throw std::logic_error(std::format("No choice callback to ask seat {} about {}", request.player_seat, request.reason));
    }
    ChoiceResult result = get_player_choice(request);
    if (result.request_id != request.request_id) {
        throw std::logic_error(std::format("Choice for {} answered request {} instead of {}", request.reason,
                                           result.request_id, request.request_id));
    }
    return result;
}

bool ResolutionContext::confirm(int seat, const std::string& reason) const {
    ChoiceRequest request(seat, ChoiceType::CONFIRM, true, reason);
    return ask(request).isConfirmed();
}

void ResolutionContext::log(const std::string& kind,
                            const std::string& message,
                            spdlog::level::level_enum level,
                            std::map<std::string, std::string> data) const {
    emitLog(log_sink, LogEntry{kind, level, message, std::move(data)});
}
