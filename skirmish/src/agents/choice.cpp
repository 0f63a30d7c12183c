// choice.cpp
#include "choice.h"

#include <format>
#include <stdexcept>

std::string toString(ChoiceType type) {
    switch (type) {
        case ChoiceType::SELECT_TARGETS:
            return "SelectTargets";
        case ChoiceType::SELECT_CARDS:
            return "SelectCards";
        case ChoiceType::CONFIRM:
            return "Confirm";
        case ChoiceType::SELECT_OPTION:
            return "SelectOption";
    }
    throw std::invalid_argument("Unknown choice type");
}

ChoiceRequest::ChoiceRequest(int player_seat, ChoiceType choice_type, bool can_pass, const std::string& reason)
    : request_id(nextRequestId()), player_seat(player_seat), choice_type(choice_type), can_pass(can_pass), reason(reason) {}

std::string ChoiceRequest::nextRequestId() {
    static int next_id = 0;
    return std::format("req-{}", next_id++);
}

ChoiceResult ChoiceResult::pass(const ChoiceRequest& request) {
    return ChoiceResult(request.request_id, request.player_seat);
}

ChoiceResult ChoiceResult::cards(const ChoiceRequest& request, std::vector<int> card_ids) {
    ChoiceResult result(request.request_id, request.player_seat);
    result.selected_card_ids = std::move(card_ids);
    return result;
}

ChoiceResult ChoiceResult::confirm(const ChoiceRequest& request, bool value) {
    ChoiceResult result(request.request_id, request.player_seat);
    result.confirmed = value;
    return result;
}

ChoiceResult ChoiceResult::option(const ChoiceRequest& request, const std::string& option_id) {
    ChoiceResult result(request.request_id, request.player_seat);
    result.selected_option_id = option_id;
    return result;
}

ChoiceResult ChoiceResult::forAction(int player_seat, std::vector<int> card_ids, std::vector<int> target_seats) {
    ChoiceResult result(ChoiceRequest::nextRequestId(), player_seat);
    result.selected_card_ids = std::move(card_ids);
    result.selected_target_seats = std::move(target_seats);
    return result;
}

bool ChoiceResult::isConfirmed() const {
    return confirmed.value_or(false);
}
