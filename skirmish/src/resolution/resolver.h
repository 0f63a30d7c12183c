#pragma once

#include <string>

#include "resolution/resolution_result.h"

class ResolutionContext;

// One step of a resolution chain. A resolver may mutate the game through the context's services,
// push follow-up resolvers onto the context's stack and write into the chain's session.
class Resolver {
public:
    virtual ~Resolver() = default;
    virtual ResolutionResult resolve(ResolutionContext& context) = 0;
    virtual std::string kind() const = 0;
};
