// agent.cpp
#include "agent.h"

#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

ChoiceResult PassingAgent::choose(const ChoiceRequest& request) {
    if (request.choice_type == ChoiceType::CONFIRM) {
        return ChoiceResult::confirm(request, false);
    }
    return ChoiceResult::pass(request);
}

ChoiceResult EagerAgent::choose(const ChoiceRequest& request) {
    switch (request.choice_type) {
        case ChoiceType::CONFIRM:
            return ChoiceResult::confirm(request, true);
        case ChoiceType::SELECT_OPTION:
            if (!request.options.empty()) {
                return ChoiceResult::option(request, request.options.front());
            }
            break;
        case ChoiceType::SELECT_CARDS:
        case ChoiceType::SELECT_TARGETS:
            if (!request.allowed_card_ids.empty()) {
                return ChoiceResult::cards(request, {request.allowed_card_ids.front()});
            }
            break;
    }
    return ChoiceResult::pass(request);
}

ScriptedAgent& ScriptedAgent::then(Reply reply) {
    replies.push_back(std::move(reply));
    return *this;
}

ScriptedAgent& ScriptedAgent::thenPass() {
    return then([](const ChoiceRequest& request) { return ChoiceResult::pass(request); });
}

ScriptedAgent& ScriptedAgent::thenConfirm(bool value) {
    return then([value](const ChoiceRequest& request) { return ChoiceResult::confirm(request, value); });
}

ScriptedAgent& ScriptedAgent::thenCards(std::vector<int> card_ids) {
    return then([card_ids](const ChoiceRequest& request) { return ChoiceResult::cards(request, card_ids); });
}

ChoiceResult ScriptedAgent::choose(const ChoiceRequest& request) {
    seen.push_back(request);
    if (replies.empty()) {
        return ChoiceResult::pass(request);
    }
    Reply reply = std::move(replies.front());
    replies.pop_front();
    return reply(request);
}

Agent* AgentTable::seat(int seat, std::unique_ptr<Agent> agent) {
    if (!agent) {
        throw std::invalid_argument("Cannot seat a null agent");
    }
    Agent* raw = agent.get();
    agents[seat] = std::move(agent);
    return raw;
}

Agent* AgentTable::at(int seat) const {
    auto it = agents.find(seat);
    return it == agents.end() ? nullptr : it->second.get();
}

ChoiceCallback AgentTable::callback() {
    return [this](const ChoiceRequest& request) {
        Agent* agent = at(request.player_seat);
        if (agent == nullptr) {
            throw std::logic_error(std::format("No agent seated at {}", request.player_seat));
        }
        spdlog::debug("Seat {} chooses for {} ({})", request.player_seat, request.reason, toString(request.choice_type));
        return agent->choose(request);
    };
}
