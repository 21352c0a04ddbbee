#include "format.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace mre::nfa {

namespace {

std::string printable(char c) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isprint(byte)) {
        return std::string(1, c);
    }
    return fmt::format("\\x{:02x}", byte);
}

}  // namespace

std::string to_str(const NFA& nfa) {
    std::string out;
    auto it = std::back_inserter(out);

    for (StateID state = 0; state < nfa.state_count(); ++state) {
        const auto& trans = nfa.transitions(state);
        if (trans.epsilon) {
            fmt::format_to(it, "{} -[eps]-> {}\n", state, *trans.epsilon);
        }

        std::vector<std::pair<char, StateID>> literals(trans.literals.begin(),
                                                       trans.literals.end());
        std::ranges::sort(literals, {}, [](const auto& edge) {
            return static_cast<unsigned char>(edge.first);
        });
        for (const auto& [c, target] : literals) {
            fmt::format_to(it, "{} -[{}]-> {}\n", state, printable(c), target);
        }

        if (trans.wildcard) {
            fmt::format_to(it, "{} -[any]-> {}\n", state, *trans.wildcard);
        }
    }

    std::vector<StateID> accepting(nfa.accept_states.begin(),
                                   nfa.accept_states.end());
    std::ranges::sort(accepting);
    fmt::format_to(it, "accept: {{{}}}\n", fmt::join(accepting, ", "));

    return out;
}

}  // namespace mre::nfa
