#include "compile.hpp"
#include <type_traits>
#include <utility>
#include "tokenize.hpp"

namespace mre::nfa {

namespace {

template <typename T>
constexpr bool always_false = false;

}  // namespace

// Unanchored patterns may start matching anywhere. A wildcard edge leaving
// state 0 for the pattern itself replaces this loop.
Builder::Builder() {
    nfa_.add_transition(nfa_.start_state, WildcardTransition{},
                        nfa_.start_state);
}

void Builder::add_consuming(TransitionCondition cond) {
    nfa_.add_transition(current_, cond, current_ + 1);
    ++current_;
}

void Builder::add_literal(char c) {
    add_consuming(c);
    bound_ = BoundLiteral{current_ - 1, c, current_};
}

void Builder::add_optional() {
    nfa_.add_transition(bound_->from, EpsilonTransition{}, bound_->to);
}

void Builder::add_kleene_star() {
    nfa_.remove_transition(bound_->from, bound_->value);
    nfa_.add_transition(bound_->from, EpsilonTransition{}, bound_->to);
    nfa_.add_transition(bound_->to, bound_->value, bound_->to);
}

void Builder::add_positive_closure() {
    nfa_.add_transition(bound_->to, bound_->value, bound_->to);
}

void Builder::add(const token::Token& token) {
    std::visit(
        [&](auto&& tok) {
            using T = std::decay_t<decltype(tok)>;

            if constexpr (std::is_same_v<T, token::Literal>) {
                add_literal(tok.value);
                return;
            } else if constexpr (std::is_same_v<T, token::Wildcard>) {
                add_consuming(WildcardTransition{});
            } else if constexpr (std::is_same_v<T, token::DollarSign>) {
                add_consuming('$');
            } else if constexpr (std::is_same_v<T, token::StartAnchor>) {
                nfa_.remove_transition(nfa_.start_state,
                                       WildcardTransition{});
            } else if constexpr (std::is_same_v<T, token::EndAnchor>) {
                end_anchored_ = true;
            } else if constexpr (std::is_same_v<T, token::Optional>) {
                if (bound_) {
                    add_optional();
                }
            } else if constexpr (std::is_same_v<T, token::KleeneStar>) {
                if (bound_) {
                    add_kleene_star();
                }
            } else if constexpr (std::is_same_v<T, token::PositiveClosure>) {
                if (bound_) {
                    add_positive_closure();
                }
            } else {
                static_assert(always_false<T>, "Non-exhaustive visitor");
            }
            // Only a literal directly before a quantifier can be quantified.
            bound_.reset();
        },
        token);
}

NFA Builder::build() && {
    if (!end_anchored_) {
        nfa_.add_transition(current_, WildcardTransition{}, current_);
    }
    nfa_.set_accepting(current_, true);
    return std::move(nfa_);
}

NFA compile(std::string_view pattern) {
    Builder builder;
    for (auto&& token : token::tokenize(pattern)) {
        builder.add(token);
    }
    return std::move(builder).build();
}

}  // namespace mre::nfa
