#pragma once

#include <optional>
#include <string_view>
#include "nfa.hpp"
#include "token.hpp"

namespace mre::nfa {

// Assembles an NFA from a token stream in a single left-to-right pass.
// Quantifiers and anchors are applied as edits to the transition relation.
// The builder owns the automaton until build() hands it over.
class Builder {
public:
    Builder();

    void add(const token::Token& token);

    NFA build() &&;

private:
    // Edge of the literal immediately preceding the current token.
    struct BoundLiteral {
        StateID from;
        char value;
        StateID to;
    };

    void add_literal(char c);
    void add_consuming(TransitionCondition cond);
    void add_optional();
    void add_kleene_star();
    void add_positive_closure();

    NFA nfa_;
    StateID current_ = 0;
    bool end_anchored_ = false;
    std::optional<BoundLiteral> bound_;
};

// Never fails: every pattern yields an automaton.
NFA compile(std::string_view pattern);

}  // namespace mre::nfa
