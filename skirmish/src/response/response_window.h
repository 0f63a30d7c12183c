#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agents/choice.h"
#include "resolution/resolution_session.h"
#include "resolution/resolver.h"
#include "rules/rule_context.h"

class Card;
class Game;
class Player;
class RuleService;
class CardMoveService;
class LogSink;
class EventBus;
class ResolutionContext;

enum class ResponseWindowState {
    NO_RESPONSE,
    RESPONSE_SUCCESS,
    // A responder started answering but stopped short of the required count.
    RESPONSE_FAILED
};

std::string toString(ResponseWindowState state);

// What the window is answering.
struct SourceEvent {
    std::string kind;
    std::optional<int> source_seat;
    std::optional<int> target_seat;
    const Card* card = nullptr;
};

struct ResponseWindowResult {
    ResponseWindowState state = ResponseWindowState::NO_RESPONSE;
    std::optional<int> responder_seat;
    Card* responded_card = nullptr;
    int units_provided = 0;
};

inline constexpr SessionKey<ResponseWindowResult> kLastResponseResult{"LastResponseResult"};

struct ResponseWindowContext {
    Game* game = nullptr;
    ResponseType response_type = ResponseType::ATTACK_EVADE;
    std::vector<Player*> responders;
    SourceEvent source_event;
    RuleService* rules = nullptr;
    CardMoveService* card_moves = nullptr;
    LogSink* log_sink = nullptr;
    EventBus* event_bus = nullptr;
    int required_response_count = 1;
};

// Polls responders in list order, once each. The first responder to supply the required number of
// legal cards wins. Empty or illegal selections count as a pass.
class ResponseWindow {
public:
    explicit ResponseWindow(ResponseWindowContext context);

    // chain, when given, is attached to the ResponsePlayedEvent raised for each card.
    ResponseWindowResult execute(const ChoiceCallback& get_player_choice, ResolutionContext* chain = nullptr);

    const ResponseWindowContext& context() const { return window; }

private:
    ResponseWindowContext window;

    void log(const std::string& kind, const std::string& message, std::optional<int> seat, bool warning = false) const;
};

// Runs a ResponseWindow inside a resolution chain and stores its result under kLastResponseResult.
// The chain must carry a session.
class ResponseWindowResolver : public Resolver {
public:
    explicit ResponseWindowResolver(ResponseWindowContext window);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "response-window"; }

    const ResponseWindowContext& window() const { return window_context; }

private:
    ResponseWindowContext window_context;
};

ResponseWindowContext makeWindowContext(const ResolutionContext& context,
                                        ResponseType type,
                                        std::vector<Player*> responders,
                                        const SourceEvent& source,
                                        int required_response_count = 1);

std::unique_ptr<ResponseWindowResolver> evadeWindow(const ResolutionContext& context,
                                                    Player* responder,
                                                    ResponseType type,
                                                    const SourceEvent& source,
                                                    int required_response_count = 1);

// The dying player answers first, then every other living player in seat order.
std::unique_ptr<ResponseWindowResolver> peachWindow(const ResolutionContext& context,
                                                    Player* dying,
                                                    const SourceEvent& source);
