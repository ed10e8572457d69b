#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Finds the transition whose target status equals desired_status, ignoring
// case. Throws NoMatchingTransitionError (carrying every available target
// name) or AmbiguousTransitionError (carrying every match).
std::string resolve_transition(const std::vector<Transition>& transitions, const std::string& desired_status);
