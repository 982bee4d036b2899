#include "oracle/subgoal_oracle.hpp"

namespace gamemind {

std::string toString(Complexity c) {
    switch (c) {
        case Complexity::SIMPLE:  return "simple";
        case Complexity::MEDIUM:  return "medium";
        case Complexity::COMPLEX: return "complex";
    }
    return "medium";
}

} // namespace gamemind
