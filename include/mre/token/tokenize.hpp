#pragma once

#include <string_view>
#include <vector>
#include "token.hpp"

namespace mre::token {

std::vector<Token> tokenize(std::string_view pattern);

}  // namespace mre::token
