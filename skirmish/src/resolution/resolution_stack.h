#pragma once

#include <memory>
#include <string>
#include <vector>

#include "resolution/resolution_context.h"
#include "resolution/resolver.h"

struct ResolutionRecord {
    std::string kind;
    int sequence;
    ResolutionResult result;
};

// LIFO interpreter for one top-level action. Every pop runs exactly one resolver and appends
// one record to the history.
class ResolutionStack {
public:
    ResolutionStack() = default;

    ResolutionStack(const ResolutionStack&) = delete;
    ResolutionStack& operator=(const ResolutionStack&) = delete;

    void push(std::unique_ptr<Resolver> resolver, const ResolutionContext& context);
    // Throws std::logic_error on an empty stack. Faults thrown by the resolver propagate and leave
    // the remaining frames in place.
    ResolutionResult pop();
    // Pops until empty. Returns the first failure, or success.
    ResolutionResult drain();

    bool isEmpty() const;
    size_t size() const;
    const std::vector<ResolutionRecord>& history() const;
    std::vector<std::string> historyKinds() const;

private:
    struct Frame {
        std::unique_ptr<Resolver> resolver;
        ResolutionContext context;
    };

    std::vector<Frame> frames;
    std::vector<ResolutionRecord> records;
};
