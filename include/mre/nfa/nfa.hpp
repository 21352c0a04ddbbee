#pragma once

#include <cstddef>
#include <optional>
#include <queue>
#include <ranges>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace mre::nfa {

using StateID = std::size_t;

struct EpsilonTransition {};
// Taken only when no literal edge of the same state matches.
struct WildcardTransition {};
using TransitionCondition =
    std::variant<EpsilonTransition, char, WildcardTransition>;

// Outgoing edges of one state. Each condition has at most one destination.
struct StateTransitions {
    std::optional<StateID> epsilon;
    std::unordered_map<char, StateID> literals;
    std::optional<StateID> wildcard;
};

class NFA {
public:
    NFA();

    StateID create_state();
    std::size_t state_count() const;

    // States referenced by `from` or `to` are created on demand. An existing
    // edge with the same condition is redirected to `to`.
    void add_transition(StateID from, TransitionCondition cond, StateID to);
    void remove_transition(StateID from, TransitionCondition cond);
    std::optional<StateID> target(StateID from,
                                  TransitionCondition cond) const;
    const StateTransitions& transitions(StateID state) const;

    void set_accepting(StateID state, bool accepting);
    bool is_accepting(StateID state) const;

    std::vector<StateTransitions> states;
    std::unordered_set<StateID> accept_states;
    StateID start_state = 0;

private:
    void ensure_state(StateID state);
};

template <template <class...> class Set, std::ranges::input_range R>
Set<StateID> epsilon_closure(const NFA& nfa, R&& states) {
    Set<StateID> closure(std::ranges::begin(states), std::ranges::end(states));
    std::queue<StateID> processing_queue(closure.begin(), closure.end());

    while (!processing_queue.empty()) {
        auto current = processing_queue.front();
        processing_queue.pop();

        if (current >= nfa.states.size()) {
            continue;
        }
        if (auto next = nfa.states[current].epsilon;
            next && !closure.contains(*next)) {
            closure.insert(*next);
            processing_queue.push(*next);
        }
    }

    return closure;
}

}  // namespace mre::nfa
