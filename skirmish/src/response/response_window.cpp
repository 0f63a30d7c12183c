// response_window.cpp
#include "response_window.h"

#include "events/event_bus.h"
#include "logging/log_sink.h"
#include "resolution/resolution_context.h"
#include "rules/game.h"
#include "rules/rule_service.h"
#include "zones/card_move_service.h"

#include <algorithm>
#include <format>
#include <stdexcept>

std::string toString(ResponseWindowState state) {
    switch (state) {
        case ResponseWindowState::NO_RESPONSE:
            return "NoResponse";
        case ResponseWindowState::RESPONSE_SUCCESS:
            return "ResponseSuccess";
        case ResponseWindowState::RESPONSE_FAILED:
            return "ResponseFailed";
    }
    throw std::invalid_argument("Unknown response window state");
}

ResponseWindow::ResponseWindow(ResponseWindowContext context) : window(std::move(context)) {
    if (window.game == nullptr || window.rules == nullptr || window.card_moves == nullptr) {
        throw std::invalid_argument("Response window needs a game, a rule service and a card move service");
    }
    if (window.required_response_count < 1) {
        throw std::invalid_argument(
            std::format("Response window needs at least one response, got {}", window.required_response_count));
    }
}

void ResponseWindow::log(const std::string& kind, const std::string& message, std::optional<int> seat, bool warning) const {
    std::map<std::string, std::string> data{{"responseType", toString(window.response_type)},
                                            {"source", window.source_event.kind}};
    if (seat) {
        data["seat"] = std::to_string(*seat);
    }
    emitLog(window.log_sink,
            LogEntry{kind, warning ? spdlog::level::warn : spdlog::level::info, message, std::move(data)});
}

ResponseWindowResult ResponseWindow::execute(const ChoiceCallback& get_player_choice, ResolutionContext* chain) {
    if (!get_player_choice) {
        throw std::invalid_argument("Response window needs a choice callback");
    }
    const std::string reason = "response." + toString(window.response_type);
    log("ResponseWindowOpened", std::format("{} window with {} responders", toString(window.response_type),
                                            window.responders.size()), std::nullopt);

    for (Player* responder : window.responders) {
        if (responder == nullptr || !responder->alive) {
            continue;
        }

        int units = 0;
        Card* last_card = nullptr;
        while (units < window.required_response_count) {
            ResponseContext response{window.game, responder, window.response_type, window.source_event.card,
                                     window.source_event.source_seat};
            std::vector<Card*> legal = window.rules->legalResponseCards(response);
            if (legal.empty()) {
                spdlog::debug("{} has no legal {} response", responder->toString(), toString(window.response_type));
                break;
            }

            ChoiceRequest request(responder->seat, ChoiceType::SELECT_CARDS, true, reason);
            for (const Card* card : legal) {
                request.allowed_card_ids.push_back(card->id);
            }
            ChoiceResult choice = get_player_choice(request);
            if (choice.request_id != request.request_id) {
                throw std::logic_error(std::format("Response from seat {} answered request {} instead of {}",
                                                   responder->seat, choice.request_id, request.request_id));
            }

            if (choice.selected_card_ids.empty()) {
                log("ResponsePassed", std::format("{} passes", responder->toString()), responder->seat);
                break;
            }

            Card* card = nullptr;
            if (choice.selected_card_ids.size() == 1) {
                int selected = choice.selected_card_ids.front();
                auto it = std::find_if(legal.begin(), legal.end(), [selected](const Card* c) { return c->id == selected; });
                card = it == legal.end() ? nullptr : *it;
            }
            if (card == nullptr) {
                log("ResponseInvalid", std::format("{} selected an illegal response, treated as a pass",
                                                   responder->toString()), responder->seat, true);
                break;
            }

            window.card_moves->discardFromHand(*responder, {card});
            units += 1;
            last_card = card;
            log("ResponseCardPlayed", std::format("{} responds with {}", responder->toString(), card->toString()),
                responder->seat);

            if (window.event_bus) {
                ResponsePlayedEvent played;
                played.game = window.game;
                played.context = chain;
                played.seat = responder->seat;
                played.card_id = card->id;
                played.response_type = window.response_type;
                window.event_bus->publish(played);
            }
        }

        if (units >= window.required_response_count) {
            log("ResponseWindowClosed", "response succeeded", responder->seat);
            return ResponseWindowResult{ResponseWindowState::RESPONSE_SUCCESS, responder->seat, last_card, units};
        }
        if (units > 0) {
            log("ResponseWindowClosed", std::format("response stopped after {} of {}", units,
                                                    window.required_response_count), responder->seat);
            return ResponseWindowResult{ResponseWindowState::RESPONSE_FAILED, responder->seat, last_card, units};
        }
    }

    log("ResponseWindowClosed", "no response", std::nullopt);
    return ResponseWindowResult{};
}

ResponseWindowResolver::ResponseWindowResolver(ResponseWindowContext window) : window_context(std::move(window)) {}

ResolutionResult ResponseWindowResolver::resolve(ResolutionContext& context) {
    ResolutionSession& session = context.requireSession(kind());
    if (!context.canAskPlayers()) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.responseWindow.noChoiceCallback");
    }

    ResponseWindow window(window_context);
    ResponseWindowResult result = window.execute(context.get_player_choice, &context);
    session.set(kLastResponseResult, result);

    if (result.state == ResponseWindowState::RESPONSE_FAILED) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.responseWindow.failed");
    }
    return ResolutionResult::ok();
}

ResponseWindowContext makeWindowContext(const ResolutionContext& context,
                                        ResponseType type,
                                        std::vector<Player*> responders,
                                        const SourceEvent& source,
                                        int required_response_count) {
    ResponseWindowContext window;
    window.game = context.game;
    window.response_type = type;
    window.responders = std::move(responders);
    window.source_event = source;
    window.rules = context.rules;
    window.card_moves = context.card_moves;
    window.log_sink = context.log_sink;
    window.event_bus = context.event_bus;
    window.required_response_count = required_response_count;
    return window;
}

std::unique_ptr<ResponseWindowResolver> evadeWindow(const ResolutionContext& context,
                                                    Player* responder,
                                                    ResponseType type,
                                                    const SourceEvent& source,
                                                    int required_response_count) {
    return std::make_unique<ResponseWindowResolver>(
        makeWindowContext(context, type, {responder}, source, required_response_count));
}

std::unique_ptr<ResponseWindowResolver> peachWindow(const ResolutionContext& context,
                                                    Player* dying,
                                                    const SourceEvent& source) {
    std::vector<Player*> responders{dying};
    for (Player* other : context.game->seatOrderAfter(dying->seat)) {
        responders.push_back(other);
    }
    return std::make_unique<ResponseWindowResolver>(
        makeWindowContext(context, ResponseType::PEACH_FOR_DYING, responders, source));
}
