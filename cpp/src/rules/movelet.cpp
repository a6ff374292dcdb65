#include "../../include/rules/movelet.hpp"
#include <stdexcept>

namespace farkle::rules {

namespace {

constexpr int kStraightPoints = 1500;
constexpr int kThreePairsPoints = 1500;

Movelet make_movelet(MoveletKind kind, int face, int points, const FaceCounts& consumes) {
    return Movelet{kind, face, points, consumes, total_dice(consumes)};
}

std::vector<Movelet> build_rule_table() {
    std::vector<Movelet> table;

    FaceCounts one{};
    one[1] = 1;
    table.push_back(make_movelet(MoveletKind::kSingle, 1, 100, one));

    FaceCounts five{};
    five[5] = 1;
    table.push_back(make_movelet(MoveletKind::kSingle, 5, 50, five));

    for (int face = 1; face <= 6; face++) {
        for (int count = 3; count <= kMaxDice; count++) {
            FaceCounts consumes{};
            consumes[face] = count;
            table.push_back(make_movelet(MoveletKind::kOfAKind, face,
                                         of_a_kind_points(face, count), consumes));
        }
    }

    FaceCounts straight{};
    for (int face = 1; face <= 6; face++) {
        straight[face] = 1;
    }
    table.push_back(make_movelet(MoveletKind::kStraight, 0, kStraightPoints, straight));

    // Every multiset of three pair faces; a repeated face covers 4-of-a-kind
    // plus a pair, or six of a kind.
    for (int a = 1; a <= 6; a++) {
        for (int b = a; b <= 6; b++) {
            for (int c = b; c <= 6; c++) {
                FaceCounts pairs{};
                pairs[a] += 2;
                pairs[b] += 2;
                pairs[c] += 2;
                table.push_back(make_movelet(MoveletKind::kThreePairs, 0, kThreePairsPoints, pairs));
            }
        }
    }

    return table;
}

} // namespace

int of_a_kind_points(int face, int count) {
    if (face < 1 || face > 6 || count < 3 || count > kMaxDice) {
        throw std::invalid_argument("No of-a-kind score for " + std::to_string(count) +
                                    " x " + std::to_string(face));
    }
    int base = (face == 1) ? 1000 : face * 100;
    return base * (1 << (count - 3));
}

const std::vector<Movelet>& movelets() {
    static const std::vector<Movelet> table = build_rule_table();
    return table;
}

std::string Movelet::name() const {
    switch (kind) {
        case MoveletKind::kSingle:
            return "single " + std::to_string(face);
        case MoveletKind::kOfAKind:
            return std::to_string(dice) + " x " + std::to_string(face);
        case MoveletKind::kStraight:
            return "straight";
        case MoveletKind::kThreePairs:
            return "three pairs";
    }
    return "unknown";
}

} // namespace farkle::rules
