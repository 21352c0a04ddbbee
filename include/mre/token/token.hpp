#pragma once

#include <variant>

namespace mre::token {

struct Literal {
    char value;
};
struct Wildcard {};
struct StartAnchor {};
struct EndAnchor {};
// Unescaped '$' that is not the last character of the pattern.
struct DollarSign {};
struct Optional {};
struct KleeneStar {};
struct PositiveClosure {};

using Token = std::variant<Literal,
                           Wildcard,
                           StartAnchor,
                           EndAnchor,
                           DollarSign,
                           Optional,
                           KleeneStar,
                           PositiveClosure>;

}  // namespace mre::token
