#pragma once

#include <string_view>
#include "nfa.hpp"

namespace mre::nfa {

// Simulates `nfa` over `str` by tracking the set of live states. From each
// live state a literal edge for the current byte is preferred over the
// wildcard edge.
bool run(const NFA& nfa, std::string_view str);

class NFAMatcher {
public:
    explicit NFAMatcher(std::string_view pattern);

    explicit NFAMatcher(NFA&& nfa);

    bool is_match(std::string_view str) const;

    const NFA& automaton() const;

    NFA extract() &&;

    void replace(NFA&& nfa);

private:
    NFA nfa_;
};

}  // namespace mre::nfa
