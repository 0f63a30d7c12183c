#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "agents/action.h"

enum class ChoiceType {
    SELECT_TARGETS,
    SELECT_CARDS,
    CONFIRM,
    SELECT_OPTION
};

std::string toString(ChoiceType type);

class ChoiceRequest {
public:
    std::string request_id;
    int player_seat;
    ChoiceType choice_type;
    std::optional<TargetConstraints> target_constraints;
    std::vector<int> allowed_card_ids;
    std::vector<std::string> options;
    bool can_pass;
    // What the decision is about, e.g. "response.evade".
    std::string reason;

    ChoiceRequest(int player_seat, ChoiceType choice_type, bool can_pass, const std::string& reason);

    static std::string nextRequestId();
};

class ChoiceResult {
public:
    std::string request_id;
    int player_seat;
    std::vector<int> selected_target_seats;
    std::vector<int> selected_card_ids;
    std::optional<std::string> selected_option_id;
    // Unset when the request was not a confirmation.
    std::optional<bool> confirmed;

    ChoiceResult(const std::string& request_id, int player_seat) : request_id(request_id), player_seat(player_seat) {}

    static ChoiceResult pass(const ChoiceRequest& request);
    static ChoiceResult cards(const ChoiceRequest& request, std::vector<int> card_ids);
    static ChoiceResult confirm(const ChoiceRequest& request, bool value);
    static ChoiceResult option(const ChoiceRequest& request, const std::string& option_id);
    // Top-level action choices are built before any request exists.
    static ChoiceResult forAction(int player_seat, std::vector<int> card_ids, std::vector<int> target_seats = {});

    bool isConfirmed() const;
};

using ChoiceCallback = std::function<ChoiceResult(const ChoiceRequest&)>;
