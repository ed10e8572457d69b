#include "transition_resolver.hpp"
#include "errors.hpp"
#include "util.hpp"

std::string resolve_transition(const std::vector<Transition>& transitions, const std::string& desired_status) {
    std::vector<Transition> matches;
    std::vector<std::string> available;

    for (const auto& transition : transitions) {
        available.push_back(transition.to_status);
        if (util::iequals(transition.to_status, desired_status)) {
            matches.push_back(transition);
        }
    }

    if (matches.empty()) {
        throw NoMatchingTransitionError(desired_status, std::move(available));
    }

    if (matches.size() > 1) {
        throw AmbiguousTransitionError(desired_status, std::move(matches));
    }

    return matches.front().id;
}
