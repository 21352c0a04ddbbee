#include "tokenize.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace mre::token {

std::vector<Token> tokenize(std::string_view pattern) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    if (!pattern.empty() && pattern.front() == '^') {
        tokens.emplace_back(StartAnchor{});
        ++pos;
    }
    while (pos < pattern.size()) {
        const char c = pattern[pos];
        const bool last = pos + 1 == pattern.size();
        switch (c) {
            case '\\':
                // A trailing backslash has nothing to escape and is dropped.
                if (!last) {
                    tokens.emplace_back(Literal{pattern[pos + 1]});
                }
                pos += 2;
                break;
            case '.':
                tokens.emplace_back(Wildcard{});
                ++pos;
                break;
            case '$':
                if (last) {
                    tokens.emplace_back(EndAnchor{});
                } else {
                    tokens.emplace_back(DollarSign{});
                }
                ++pos;
                break;
            case '?':
                tokens.emplace_back(Optional{});
                ++pos;
                break;
            case '*':
                tokens.emplace_back(KleeneStar{});
                ++pos;
                break;
            case '+':
                tokens.emplace_back(PositiveClosure{});
                ++pos;
                break;
            default:
                tokens.emplace_back(Literal{c});
                ++pos;
                break;
        }
    }
    return tokens;
}

}  // namespace mre::token
