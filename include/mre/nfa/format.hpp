#pragma once

#include <string>
#include "nfa.hpp"

namespace mre::nfa {

// One edge per line, states ascending, followed by the accepting states:
//
//   0 -[a]-> 1
//   0 -[any]-> 0
//   1 -[eps]-> 2
//   accept: {2}
std::string to_str(const NFA& nfa);

}  // namespace mre::nfa
