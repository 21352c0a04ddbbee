#include "nfa_matcher.hpp"
#include <algorithm>
#include <optional>
#include <ranges>
#include <string_view>
#include <unordered_set>
#include <utility>
#include "compile.hpp"
#include "nfa.hpp"

namespace mre::nfa {

namespace {

std::optional<StateID> step(const NFA& nfa, StateID state, char c) {
    if (auto next = nfa.target(state, c)) {
        return next;
    }
    return nfa.target(state, WildcardTransition{});
}

}  // namespace

bool run(const NFA& nfa, std::string_view str) {
    auto current = epsilon_closure<std::unordered_set>(
        nfa, std::views::single(nfa.start_state));

    for (char c : str) {
        std::unordered_set<StateID> next_states;

        for (auto state : current) {
            if (auto next = step(nfa, state, c)) {
                next_states.insert(*next);
            }
        }

        if (next_states.empty()) {
            return false;
        }

        current = epsilon_closure<std::unordered_set>(nfa, next_states);
    }

    return std::ranges::any_of(
        current, [&nfa](StateID state) { return nfa.is_accepting(state); });
}

NFAMatcher::NFAMatcher(std::string_view pattern) : nfa_(compile(pattern)) {}

NFAMatcher::NFAMatcher(NFA&& nfa) : nfa_(std::move(nfa)) {}

bool NFAMatcher::is_match(std::string_view str) const {
    return run(nfa_, str);
}

const NFA& NFAMatcher::automaton() const {
    return nfa_;
}

NFA NFAMatcher::extract() && {
    return std::move(nfa_);
}

void NFAMatcher::replace(NFA&& nfa) {
    nfa_ = std::move(nfa);
}

}  // namespace mre::nfa
