#pragma once
#include "../common.hpp"
#include <string>
#include <vector>

namespace farkle::rules {

enum class MoveletKind : int8_t {
    kSingle,      // a lone 1 or 5
    kOfAKind,     // three to six dice of one face
    kStraight,    // 1-2-3-4-5-6
    kThreePairs   // six dice forming three pairs
};

// Elementary scoring pattern: consumes a fixed multiset of faces for a fixed
// number of points.
struct Movelet {
    MoveletKind kind;
    int face;             // face for singles and of-a-kind, 0 otherwise
    int points;
    FaceCounts consumes;  // faces this pattern removes from the roll
    int dice;             // total dice consumed

    std::string name() const;
};

// Full rule table. Built once, ordered singles, of-a-kind, straight, pairs.
const std::vector<Movelet>& movelets();

// Scoring of N-of-a-kind: 3 -> base, each extra die doubles
int of_a_kind_points(int face, int count);

} // namespace farkle::rules
