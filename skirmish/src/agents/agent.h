#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "agents/choice.h"

class Agent {
public:
    virtual ~Agent() = default;
    virtual ChoiceResult choose(const ChoiceRequest& request) = 0;
};

// Passes every request and declines every confirmation.
class PassingAgent : public Agent {
public:
    ChoiceResult choose(const ChoiceRequest& request) override;
};

// Takes the first legal card or option and accepts every confirmation.
class EagerAgent : public Agent {
public:
    ChoiceResult choose(const ChoiceRequest& request) override;
};

// Answers from a queue of scripted replies, then passes.
class ScriptedAgent : public Agent {
public:
    using Reply = std::function<ChoiceResult(const ChoiceRequest&)>;

    std::vector<ChoiceRequest> seen;

    ScriptedAgent& then(Reply reply);
    ScriptedAgent& thenPass();
    ScriptedAgent& thenConfirm(bool value);
    ScriptedAgent& thenCards(std::vector<int> card_ids);

    ChoiceResult choose(const ChoiceRequest& request) override;

private:
    std::deque<Reply> replies;
};

// Routes each request to the agent sitting at the requested seat.
class AgentTable {
public:
    Agent* seat(int seat, std::unique_ptr<Agent> agent);
    Agent* at(int seat) const;
    ChoiceCallback callback();

private:
    std::map<int, std::unique_ptr<Agent>> agents;
};
