// resolution_stack.cpp
#include "resolution_stack.h"

#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

void ResolutionStack::push(std::unique_ptr<Resolver> resolver, const ResolutionContext& context) {
    if (!resolver) {
        throw std::invalid_argument("Cannot push a null resolver");
    }
    spdlog::debug("Push {} (depth {})", resolver->kind(), frames.size() + 1);
    frames.push_back(Frame{std::move(resolver), context});
}

ResolutionResult ResolutionStack::pop() {
    if (frames.empty()) {
        throw std::logic_error("Cannot pop an empty resolution stack");
    }
    Frame frame = std::move(frames.back());
    frames.pop_back();

    ResolutionResult result = frame.resolver->resolve(frame.context);
    int sequence = static_cast<int>(records.size());
    records.push_back(ResolutionRecord{frame.resolver->kind(), sequence, result});
    spdlog::debug("Resolved #{} {}: {}", sequence, frame.resolver->kind(), result.toString());
    return result;
}

ResolutionResult ResolutionStack::drain() {
    std::optional<ResolutionResult> first_failure;
    while (!isEmpty()) {
        ResolutionResult result = pop();
        if (!result.success && !first_failure) {
            first_failure = result;
        }
    }
    return first_failure.value_or(ResolutionResult::ok());
}

bool ResolutionStack::isEmpty() const {
    return frames.empty();
}

size_t ResolutionStack::size() const {
    return frames.size();
}

const std::vector<ResolutionRecord>& ResolutionStack::history() const {
    return records;
}

std::vector<std::string> ResolutionStack::historyKinds() const {
    std::vector<std::string> kinds;
    for (const ResolutionRecord& record : records) {
        kinds.push_back(record.kind);
    }
    return kinds;
}
