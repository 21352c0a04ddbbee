#include "nfa.hpp"
#include <algorithm>
#include <type_traits>

namespace mre::nfa {

NFA::NFA() : states(1) {}

StateID NFA::create_state() {
    states.emplace_back();
    return states.size() - 1;
}

std::size_t NFA::state_count() const {
    return states.size();
}

void NFA::ensure_state(StateID state) {
    if (state >= states.size()) {
        states.resize(state + 1);
    }
}

void NFA::add_transition(StateID from, TransitionCondition cond, StateID to) {
    ensure_state(std::max(from, to));
    auto& out = states[from];
    std::visit(
        [&](auto&& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, EpsilonTransition>) {
                out.epsilon = to;
            } else if constexpr (std::is_same_v<T, WildcardTransition>) {
                out.wildcard = to;
            } else {
                out.literals.insert_or_assign(c, to);
            }
        },
        cond);
}

void NFA::remove_transition(StateID from, TransitionCondition cond) {
    if (from >= states.size()) {
        return;
    }
    auto& out = states[from];
    std::visit(
        [&](auto&& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, EpsilonTransition>) {
                out.epsilon.reset();
            } else if constexpr (std::is_same_v<T, WildcardTransition>) {
                out.wildcard.reset();
            } else {
                out.literals.erase(c);
            }
        },
        cond);
}

std::optional<StateID> NFA::target(StateID from,
                                   TransitionCondition cond) const {
    if (from >= states.size()) {
        return std::nullopt;
    }
    const auto& out = states[from];
    return std::visit(
        [&](auto&& c) -> std::optional<StateID> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, EpsilonTransition>) {
                return out.epsilon;
            } else if constexpr (std::is_same_v<T, WildcardTransition>) {
                return out.wildcard;
            } else {
                if (auto it = out.literals.find(c); it != out.literals.end()) {
                    return it->second;
                }
                return std::nullopt;
            }
        },
        cond);
}

const StateTransitions& NFA::transitions(StateID state) const {
    return states.at(state);
}

void NFA::set_accepting(StateID state, bool accepting) {
    if (accepting) {
        ensure_state(state);
        accept_states.insert(state);
    } else {
        accept_states.erase(state);
    }
}

bool NFA::is_accepting(StateID state) const {
    return accept_states.contains(state);
}

}  // namespace mre::nfa
