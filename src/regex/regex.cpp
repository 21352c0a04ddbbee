#include "regex.hpp"
#include "format.hpp"

namespace mre {

Regex::Regex(std::string_view regex) : matcher_(regex) {}

bool Regex::is_match(std::string_view str) const {
    return matcher_.is_match(str);
}

const nfa::NFA& Regex::automaton() const {
    return matcher_.automaton();
}

std::string to_str(const Regex& re) {
    return nfa::to_str(re.automaton());
}

bool match(std::string_view regex, std::string_view str) {
    return Regex(regex).is_match(str);
}

}  // namespace mre
