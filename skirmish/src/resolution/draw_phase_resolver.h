#pragma once

#include <string>

#include "resolution/resolver.h"

// Draws the rule service's draw count for the context's source player.
class DrawPhaseResolver : public Resolver {
public:
    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "draw-phase"; }
};
