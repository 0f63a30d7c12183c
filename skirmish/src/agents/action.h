#pragma once

#include <string>
#include <utility>
#include <vector>

class Card;

enum class TargetType {
    NONE,
    SELF,
    SINGLE_OTHER,
    ALL_OTHERS
};

struct TargetConstraints {
    int min_targets = 0;
    int max_targets = 0;
    TargetType target_type = TargetType::NONE;
};

// An action a player may take, offered by the rule service.
class ActionDescriptor {
public:
    std::string action_id;
    std::string display_key;
    bool requires_targets;
    TargetConstraints target_constraints;
    std::vector<Card*> card_candidates;

    ActionDescriptor(const std::string& action_id,
                     const std::string& display_key,
                     bool requires_targets,
                     TargetConstraints target_constraints,
                     std::vector<Card*> card_candidates)
        : action_id(action_id),
          display_key(display_key),
          requires_targets(requires_targets),
          target_constraints(target_constraints),
          card_candidates(std::move(card_candidates)) {}

    bool offersCard(int card_id) const;
};
