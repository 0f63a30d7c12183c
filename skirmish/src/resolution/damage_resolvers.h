#pragma once

#include <optional>
#include <string>

#include "resolution/resolver.h"

// Applies the context's pending damage.
class DamageResolver : public Resolver {
public:
    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "damage"; }
};

// A player at zero health asks everyone, starting with themselves, for a peach.
class DyingResolver : public Resolver {
public:
    DyingResolver(int seat, std::optional<int> source_seat);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "dying"; }

private:
    int seat;
    std::optional<int> source_seat;
};

class DyingRescueResolver : public Resolver {
public:
    DyingRescueResolver(int seat, std::optional<int> source_seat);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "dying-rescue"; }

private:
    int seat;
    std::optional<int> source_seat;
};
