#pragma once

#include <string>
#include <string_view>
#include "nfa_matcher.hpp"

namespace mre {

// A compiled pattern. Matching searches for the pattern anywhere in the
// input unless it is anchored with a leading '^' or a trailing '$'.
class Regex {
public:
    explicit Regex(std::string_view regex);

    bool is_match(std::string_view str) const;

    const nfa::NFA& automaton() const;

    friend std::string to_str(const Regex& re);

private:
    nfa::NFAMatcher matcher_;
};

bool match(std::string_view regex, std::string_view str);

}  // namespace mre
